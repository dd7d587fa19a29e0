//===-- hash_test.cpp - hash and product name tests -----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "test_utils.hpp"

#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <cstring>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

namespace tek::tactclient::test {
namespace {

TEST(HashTest, ParsesLowercase) {
  const std::string_view str{"0123456789abcdef0123456789abcdef"};
  tek_tc_hash hash;
  const auto res{tek_tc_hash_parse(str.data(), str.size(), &hash)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(hash.bytes[0], 0x01);
  EXPECT_EQ(hash.bytes[7], 0xef);
  EXPECT_EQ(hash.bytes[15], 0xef);
  EXPECT_EQ(hex(hash), str);
}

TEST(HashTest, ParsesUppercaseAndFormatsLowercase) {
  const std::string_view str{"DEADBEEF00112233445566778899AABB"};
  tek_tc_hash hash;
  const auto res{tek_tc_hash_parse(str.data(), str.size(), &hash)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(hex(hash), "deadbeef00112233445566778899aabb");
}

TEST(HashTest, RejectsWrongLength) {
  tek_tc_hash hash;
  for (const std::string_view str :
       {"", "0123456789abcdef", "0123456789abcdef0123456789abcdef0"}) {
    const auto res{tek_tc_hash_parse(str.data(), str.size(), &hash)};
    EXPECT_EQ(res.primary, TEK_TC_ERRC_hash_parse) << str;
  }
}

TEST(HashTest, RejectsNonHexDigit) {
  const std::string_view str{"0123456789abcdef0123456789abcdeg"};
  tek_tc_hash hash{};
  const auto res{tek_tc_hash_parse(str.data(), str.size(), &hash)};
  EXPECT_EQ(res.type, TEK_TC_ERR_TYPE_basic);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_hash_parse);
}

TEST(HashTest, FormatsMd5OfKnownInput) {
  EXPECT_EQ(hex(md5("")), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ProductTest, ResolvesFriendlyNames) {
  EXPECT_STREQ(tek_tc_product_code("wow"), "wow");
  EXPECT_STREQ(tek_tc_product_code("overwatch"), "pro");
  EXPECT_STREQ(tek_tc_product_code("diablo4"), "fenris");
  EXPECT_STREQ(tek_tc_product_code("wow-classic-era"), "wow_classic_era");
}

TEST(ProductTest, NamesAreCaseInsensitive) {
  EXPECT_STREQ(tek_tc_product_code("WoW-Classic"), "wow_classic");
  EXPECT_STREQ(tek_tc_product_code("HEARTHSTONE"), "hsb");
}

TEST(ProductTest, UnknownNameHasNoCode) {
  EXPECT_EQ(tek_tc_product_code("starcraft9"), nullptr);
  EXPECT_EQ(tek_tc_product_code(""), nullptr);
}

TEST(ProductTest, EveryListedNameHasCode) {
  int num_names;
  const auto names{tek_tc_product_names(&num_names)};
  ASSERT_EQ(num_names, 33);
  for (int i = 0; i < num_names; ++i) {
    EXPECT_NE(tek_tc_product_code(names[i]), nullptr) << names[i];
  }
}

TEST(ErrorTest, MessagesDescribeSubError) {
  const tek_tc_err err{.type = TEK_TC_ERR_TYPE_sub,
                       .primary = TEK_TC_ERRC_fetch_data,
                       .auxiliary = TEK_TC_ERRC_ekey_not_found,
                       .extra = 0,
                       .uri = nullptr};
  auto msgs{tek_tc_err_get_msgs(&err)};
  ASSERT_NE(msgs.primary, nullptr);
  ASSERT_NE(msgs.auxiliary, nullptr);
  EXPECT_GT(std::strlen(msgs.primary), 0u);
  EXPECT_GT(std::strlen(msgs.auxiliary), 0u);
  tek_tc_err_release_msgs(&msgs);
}

TEST(ErrorTest, MessagesDescribeHttpStatus) {
  const tek_tc_err err{.type = TEK_TC_ERR_TYPE_http,
                       .primary = TEK_TC_ERRC_fetch_versions,
                       .auxiliary = 404,
                       .extra = 0,
                       .uri = nullptr};
  auto msgs{tek_tc_err_get_msgs(&err)};
  ASSERT_NE(msgs.auxiliary, nullptr);
  EXPECT_NE(std::string_view{msgs.auxiliary}.find("404"),
            std::string_view::npos);
  tek_tc_err_release_msgs(&msgs);
}

TEST(LibTest, InitAppliesDefaults) {
  const auto ctx{tek_tc_lib_init(nullptr)};
  ASSERT_NE(ctx, nullptr);
  tek_tc_lib_cleanup(ctx);
  EXPECT_NE(std::string_view{tek_tc_version()}, "");
}

} // namespace
} // namespace tek::tactclient::test
