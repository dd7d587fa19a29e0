//===-- encoding_test.cpp - encoding manifest parser tests ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "test_utils.hpp"

#include "tek-tactclient/content.h"
#include "tek-tactclient/error.h"

#include <cstdlib>
#include <cstring>
#include <gtest/gtest.h>
#include <map>
#include <ranges>
#include <string>
#include <utility>

namespace tek::tactclient::test {
namespace {

using key_map = std::map<std::string, std::pair<tek_tc_hash, tek_tc_hash>>;

/// Generate a map of @p count keys with encoding keys derived from content
///    keys.
key_map make_keys(int count) {
  key_map res;
  for (int i = 0; i < count; ++i) {
    const auto ckey{md5("content " + std::to_string(i))};
    res[hex(ckey)] = {ckey, md5("encoded " + std::to_string(i))};
  }
  return res;
}

/// Parse a manifest from a heap copy of @p data, which the parser takes
///    ownership of on success.
tek_tc_err parse(const bytes &data, tek_tc_encoding &enc) {
  const auto buf{std::malloc(data.size())};
  std::memcpy(buf, data.data(), data.size());
  const auto res{tek_tc_enc_parse(buf, static_cast<int>(data.size()), &enc)};
  if (!tek_tc_err_success(&res)) {
    std::free(buf);
  }
  return res;
}

TEST(EncodingTest, FindsEveryKeyAcrossPages) {
  const auto keys{make_keys(100)};
  tek_tc_encoding enc;
  const auto res{parse(build_encoding(keys), enc)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_GT(enc.num_pages, 1);
  EXPECT_EQ(enc.page_size, 1024);
  for (const auto &[ckey, ekey] : keys | std::views::values) {
    tek_tc_hash found;
    ASSERT_TRUE(tek_tc_enc_find(&enc, &ckey, &found)) << hex(ckey);
    EXPECT_EQ(hex(found), hex(ekey));
  }
  tek_tc_enc_free(&enc);
  EXPECT_EQ(enc.buf, nullptr);
}

TEST(EncodingTest, MissingKeyIsNotFound) {
  tek_tc_encoding enc;
  const auto res{parse(build_encoding(make_keys(40)), enc)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  for (const auto &missing :
       {md5("absent"), tek_tc_hash{}, md5("content 40")}) {
    tek_tc_hash found;
    EXPECT_FALSE(tek_tc_enc_find(&enc, &missing, &found)) << hex(missing);
  }
  tek_tc_enc_free(&enc);
}

TEST(EncodingTest, EmptyManifestFindsNothing) {
  tek_tc_encoding enc;
  const auto res{parse(build_encoding({}), enc)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(enc.num_pages, 0);
  const auto ckey{md5("anything")};
  tek_tc_hash found;
  EXPECT_FALSE(tek_tc_enc_find(&enc, &ckey, &found));
  tek_tc_enc_free(&enc);
}

TEST(EncodingTest, RejectsCorruptPage) {
  auto data{build_encoding(make_keys(60))};
  // Corrupt a byte in the last page
  data[data.size() - 1000] ^= 0xFF;
  tek_tc_encoding enc;
  const auto res{parse(data, enc)};
  EXPECT_EQ(res.type, TEK_TC_ERR_TYPE_sub);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_encoding_parse);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_checksum_mismatch);
  EXPECT_EQ(res.extra, 2);
}

TEST(EncodingTest, RejectsMagicMismatch) {
  auto data{build_encoding(make_keys(1))};
  data[0] = 'X';
  tek_tc_encoding enc;
  const auto res{parse(data, enc)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_magic_mismatch);
}

TEST(EncodingTest, RejectsUnsupportedVersion) {
  auto data{build_encoding(make_keys(1))};
  data[2] = 2;
  tek_tc_encoding enc;
  const auto res{parse(data, enc)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_unsupported_version);
}

TEST(EncodingTest, RejectsUnsupportedKeySize) {
  auto data{build_encoding(make_keys(1))};
  data[3] = 9;
  tek_tc_encoding enc;
  const auto res{parse(data, enc)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_invalid_data);
}

TEST(EncodingTest, RejectsTruncatedPages) {
  auto data{build_encoding(make_keys(10))};
  data.resize(data.size() - 1);
  tek_tc_encoding enc;
  const auto res{parse(data, enc)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_truncated_input);
}

} // namespace
} // namespace tek::tactclient::test
