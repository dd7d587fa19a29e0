//===-- install_manifest_test.cpp - install manifest parser tests ---------===//
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

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace tek::tactclient::test {
namespace {

tek_tc_err parse(const bytes &data, tek_tc_install_manifest &manifest) {
  return tek_tc_im_parse(data.data(), static_cast<int>(data.size()),
                         &manifest);
}

std::vector<im_file> sample_files() {
  return {{.path = "Wow.exe",
           .ckey = md5("exe"),
           .size = 3,
           .tags = {"Windows", "x86_64"}},
          {.path = "Wow.pdb", .ckey = md5("pdb"), .size = 3, .tags = {}},
          {.path = "Data\\enUS\\locale.txt",
           .ckey = md5("locale"),
           .size = 6,
           .tags = {"enUS"}}};
}

TEST(InstallManifestTest, ParsesEntriesInOrder) {
  tek_tc_install_manifest manifest;
  const auto res{
      parse(build_install({"Windows", "enUS", "x86_64"}, sample_files()),
            manifest)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(manifest.version, 1);
  ASSERT_EQ(manifest.num_tags, 3);
  EXPECT_STREQ(manifest.tags[0].name, "Windows");
  EXPECT_EQ(manifest.tags[0].type, 1);
  EXPECT_STREQ(manifest.tags[2].name, "x86_64");
  ASSERT_EQ(manifest.num_entries, 3);
  EXPECT_STREQ(manifest.entries[0].path, "Wow.exe");
  EXPECT_EQ(hex(manifest.entries[0].ckey), hex(md5("exe")));
  EXPECT_EQ(manifest.entries[0].size, 3u);
  EXPECT_FALSE(manifest.entries[0].has_ekey);
  EXPECT_STREQ(manifest.entries[1].path, "Wow.pdb");
  EXPECT_STREQ(manifest.entries[2].path, "Data\\enUS\\locale.txt");
  EXPECT_EQ(manifest.entries[2].size, 6u);
  tek_tc_im_free(&manifest);
  EXPECT_EQ(manifest.buf, nullptr);
}

TEST(InstallManifestTest, TransposesTagMasks) {
  tek_tc_install_manifest manifest;
  const auto res{
      parse(build_install({"Windows", "enUS", "x86_64"}, sample_files()),
            manifest)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto &exe{manifest.entries[0]};
  const auto &pdb{manifest.entries[1]};
  const auto &locale{manifest.entries[2]};
  EXPECT_TRUE(tek_tc_im_entry_has_tag(&manifest, &exe, "Windows"));
  EXPECT_TRUE(tek_tc_im_entry_has_tag(&manifest, &exe, "x86_64"));
  EXPECT_FALSE(tek_tc_im_entry_has_tag(&manifest, &exe, "enUS"));
  EXPECT_FALSE(tek_tc_im_entry_has_tag(&manifest, &pdb, "Windows"));
  EXPECT_TRUE(tek_tc_im_entry_has_tag(&manifest, &locale, "enUS"));
  EXPECT_FALSE(tek_tc_im_entry_has_tag(&manifest, &locale, "OSX"));
  EXPECT_EQ(exe.tags[0], 0xA0);
  EXPECT_EQ(locale.tags[0], 0x40);
  tek_tc_im_free(&manifest);
}

TEST(InstallManifestTest, HandlesMasksAcrossByteBoundary) {
  std::vector<im_file> files;
  for (int i = 0; i < 11; ++i) {
    files.push_back({.path = "file" + std::to_string(i),
                     .ckey = md5(std::to_string(i)),
                     .size = 1,
                     .tags = i % 3 == 0 ? std::vector<std::string>{"even3"}
                                        : std::vector<std::string>{}});
  }
  tek_tc_install_manifest manifest;
  const auto res{parse(build_install({"even3"}, files), manifest)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(manifest.num_entries, 11);
  for (int i = 0; i < 11; ++i) {
    EXPECT_EQ(tek_tc_im_entry_has_tag(&manifest, &manifest.entries[i],
                                      "even3"),
              i % 3 == 0)
        << i;
  }
  tek_tc_im_free(&manifest);
}

TEST(InstallManifestTest, ParsesEmptyManifest) {
  tek_tc_install_manifest manifest;
  const auto res{parse(build_install({}, {}), manifest)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(manifest.num_entries, 0);
  EXPECT_EQ(manifest.entries, nullptr);
  EXPECT_EQ(manifest.num_tags, 0);
  tek_tc_im_free(&manifest);
}

TEST(InstallManifestTest, RejectsMagicMismatch) {
  auto data{build_install({"Windows"}, sample_files())};
  data[1] = 'X';
  tek_tc_install_manifest manifest;
  const auto res{parse(data, manifest)};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_install_parse);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_magic_mismatch);
}

TEST(InstallManifestTest, RejectsUnsupportedVersion) {
  auto data{build_install({"Windows"}, sample_files())};
  data[2] = 2;
  tek_tc_install_manifest manifest;
  const auto res{parse(data, manifest)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_unsupported_version);
}

TEST(InstallManifestTest, RejectsUnsupportedHashSize) {
  auto data{build_install({"Windows"}, sample_files())};
  data[3] = 20;
  tek_tc_install_manifest manifest;
  const auto res{parse(data, manifest)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_invalid_data);
}

TEST(InstallManifestTest, RejectsTruncatedEntries) {
  const auto data{build_install({"Windows"}, sample_files())};
  tek_tc_install_manifest manifest;
  for (const std::size_t cut : {1u, 5u, 17u}) {
    const bytes truncated(data.begin(), data.end() - cut);
    const auto res{parse(truncated, manifest)};
    EXPECT_EQ(res.primary, TEK_TC_ERRC_install_parse) << cut;
    EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_truncated_input) << cut;
  }
}

TEST(InstallManifestTest, RejectsImpossibleEntryCount) {
  auto data{build_install({}, {})};
  // Entry count field follows magic, version, hash size and tag count
  data[6] = 0x7F;
  tek_tc_install_manifest manifest;
  const auto res{parse(data, manifest)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_truncated_input);
}

} // namespace
} // namespace tek::tactclient::test
