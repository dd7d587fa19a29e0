//===-- index_test.cpp - CKey map indexing tests --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "test_utils.hpp"

#include "tek-tactclient/cmap.h"
#include "tek-tactclient/error.h"
#include "tek-tactclient/grab.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <stdatomic.h>
#include <string>

namespace tek::tactclient::test {
namespace {

using cmap_ptr = std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)>;

cmap_ptr load(const std::filesystem::path &dir) {
  return {tek_tc_cmap_load(dir.c_str(), nullptr), tek_tc_cmap_destroy};
}

std::string path_of(tek_tc_cmap *cmap, const tek_tc_hash &ckey) {
  tek_tc_cmap_entry entry;
  if (!tek_tc_cmap_lookup(cmap, &ckey, &entry)) {
    return {};
  }
  std::string res{entry.path};
  tek_tc_cmap_entry_release(&entry);
  return res;
}

TEST(IndexTest, IndexesProductVersionTree) {
  temp_dir root;
  write_file(root.path() / "wow" / "1.0" / "Wow.pdb", "symbols");
  write_file(root.path() / "wow" / "1.0" / "Utils" / "Tool_loader.dll",
             "loader");
  write_file(root.path() / "hsb" / "2.5" / "Hearthstone.pdb", "cards");
  const auto dir{root.str()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = nullptr,
                         .base_dir = nullptr};
  auto res{tek_tc_build_index(&desc, nullptr)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_TRUE(tek_tc_err_success(&desc.cmap_warning));
  EXPECT_EQ(desc.num_indexed, 3);
  EXPECT_EQ(desc.num_skipped, 0);
  EXPECT_EQ(desc.num_entries, 3);
  const auto cmap{load(root.path())};
  ASSERT_NE(cmap.get(), nullptr);
  EXPECT_EQ(path_of(cmap.get(), md5("loader")),
            "wow/1.0/Utils/Tool_loader.dll");
  tek_tc_cmap_entry entry;
  const auto key{md5("cards")};
  ASSERT_TRUE(tek_tc_cmap_lookup(cmap.get(), &key, &entry));
  EXPECT_STREQ(entry.path, "hsb/2.5/Hearthstone.pdb");
  EXPECT_STREQ(entry.product, "hsb");
  EXPECT_STREQ(entry.version, "2.5");
  tek_tc_cmap_entry_release(&entry);
}

TEST(IndexTest, SkipsShallowAndServiceFiles) {
  temp_dir root;
  write_file(root.path() / "loose.pdb", "loose");
  write_file(root.path() / "wow" / "loose.pdb", "half");
  write_file(root.path() / "wow" / "1.0" / ".ttc-0123-0.tmp", "partial");
  write_file(root.path() / "wow" / "1.0" / "Wow.pdb", "symbols");
  const auto dir{root.str()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = nullptr,
                         .base_dir = nullptr};
  auto res{tek_tc_build_index(&desc, nullptr)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_indexed, 1);
  EXPECT_EQ(desc.num_skipped, 2);
  // Indexing again must not pick up the map file itself
  res = tek_tc_build_index(&desc, nullptr);
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_indexed, 1);
  EXPECT_EQ(desc.num_entries, 1);
  const auto cmap{load(root.path())};
  EXPECT_EQ(path_of(cmap.get(), md5("symbols")), "wow/1.0/Wow.pdb");
  EXPECT_EQ(path_of(cmap.get(), md5("partial")), "");
}

TEST(IndexTest, TakesPathsRelativeToBaseDirectory) {
  temp_dir root;
  const auto version_dir{root.path() / "downloads" / "wow" / "1.0"};
  write_file(version_dir / "Wow.pdb", "symbols");
  const auto dir{version_dir.string()};
  const auto dest{(root.path() / "maps").string()};
  const auto base{(root.path() / "downloads").string()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = dest.c_str(),
                         .base_dir = base.c_str()};
  auto res{tek_tc_build_index(&desc, nullptr)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_indexed, 1);
  EXPECT_TRUE(std::filesystem::exists(root.path() / "maps" /
                                      TEK_TC_CMAP_FILE_NAME));
  EXPECT_FALSE(std::filesystem::exists(version_dir / TEK_TC_CMAP_FILE_NAME));
  const auto cmap{load(root.path() / "maps")};
  EXPECT_EQ(path_of(cmap.get(), md5("symbols")), "wow/1.0/Wow.pdb");
}

TEST(IndexTest, KeepsExistingRecords) {
  temp_dir root;
  {
    const auto cmap{load(root.path())};
    const auto key{md5("elsewhere")};
    tek_tc_cmap_entry entry{.path = const_cast<char *>("d4/1.0/x.pdb"),
                            .product = const_cast<char *>("d4"),
                            .version = const_cast<char *>("1.0")};
    tek_tc_cmap_insert(cmap.get(), &key, &entry);
    auto res{tek_tc_cmap_save(cmap.get())};
    ASSERT_TRUE(tek_tc_err_success(&res));
  }
  write_file(root.path() / "wow" / "1.0" / "Wow.pdb", "symbols");
  const auto dir{root.str()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = nullptr,
                         .base_dir = nullptr};
  auto res{tek_tc_build_index(&desc, nullptr)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_indexed, 1);
  EXPECT_EQ(desc.num_entries, 2);
}

TEST(IndexTest, FailsOnMissingDirectory) {
  temp_dir root;
  const auto dir{(root.path() / "absent").string()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = nullptr,
                         .base_dir = nullptr};
  auto res{tek_tc_build_index(&desc, nullptr)};
  EXPECT_EQ(res.type, TEK_TC_ERR_TYPE_os);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_index_build);
  tek_tc_err_release(&res);
}

TEST(IndexTest, StopsWhenCancelled) {
  temp_dir root;
  write_file(root.path() / "wow" / "1.0" / "Wow.pdb", "symbols");
  const auto dir{root.str()};
  tek_tc_index_desc desc{.dir = dir.c_str(), .dest = nullptr,
                         .base_dir = nullptr};
  const atomic_bool cancel{true};
  auto res{tek_tc_build_index(&desc, &cancel)};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_cancelled);
  EXPECT_EQ(desc.num_indexed, 0);
}

} // namespace
} // namespace tek::tactclient::test
