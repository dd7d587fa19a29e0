//===-- tables_test.cpp - patch service table and build config tests ------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "test_utils.hpp"

#include "tek-tactclient/cdn.h"
#include "tek-tactclient/content.h"
#include "tek-tactclient/error.h"

#include <gtest/gtest.h>
#include <string>
#include <string_view>

namespace tek::tactclient::test {
namespace {

constexpr std::string_view versions_text{
    "Region!STRING:0|BuildConfig!HEX:16|CDNConfig!HEX:16|KeyRing!HEX:16|"
    "BuildId!DEC:4|VersionsName!String:0|ProductConfig!HEX:16\r\n"
    "## seqn = 2143357\r\n"
    "us|0123456789abcdef0123456789abcdef|fedcba9876543210fedcba9876543210||"
    "61265|11.2.0.61265|\r\n"
    "eu|00000000000000000000000000000001|00000000000000000000000000000002||"
    "61200|11.1.7.61200|\r\n"};

constexpr std::string_view cdns_text{
    "Name!STRING:0|Path!STRING:0|Hosts!STRING:0|Servers!STRING:0|"
    "ConfigPath!STRING:0\n"
    "## seqn = 2241282\n"
    "eu|tpr/wow|eu.cdn.blizzard.com level3.blizzard.com|"
    "http://eu.cdn.blizzard.com/?maxhosts=4 "
    "https://blzddist1-a.akamaihd.net/?fallback=1|tpr/configs/data\n"
    "us|tpr/wow|us.cdn.blizzard.com,level3.blizzard.com||tpr/configs/data\n"};

tek_tc_err parse_versions(std::string_view text, const char *region,
                          tek_tc_version_record &record) {
  return tek_tc_versions_parse(text.data(), static_cast<int>(text.size()),
                               "wow", region, &record);
}

tek_tc_err parse_cdns(std::string_view text, const char *region,
                      tek_tc_cdn_entry &entry) {
  return tek_tc_cdns_parse(text.data(), static_cast<int>(text.size()), region,
                           &entry);
}

tek_tc_err parse_bcfg(std::string_view text, tek_tc_build_config &config) {
  return tek_tc_bcfg_parse(text.data(), static_cast<int>(text.size()),
                           &config);
}

//===-- Versions table ----------------------------------------------------===//

TEST(VersionsTableTest, SelectsRegionRecord) {
  tek_tc_version_record record;
  const auto res{parse_versions(versions_text, "eu", record)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_STREQ(record.product, "wow");
  EXPECT_STREQ(record.region, "eu");
  EXPECT_EQ(record.build_id, 61200u);
  EXPECT_STREQ(record.version, "11.1.7.61200");
  EXPECT_EQ(hex(record.build_config), "00000000000000000000000000000001");
  EXPECT_EQ(hex(record.cdn_config), "00000000000000000000000000000002");
}

TEST(VersionsTableTest, DefaultsToFirstRecord) {
  tek_tc_version_record record;
  const auto res{parse_versions(versions_text, nullptr, record)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_STREQ(record.region, "us");
  EXPECT_EQ(record.build_id, 61265u);
  EXPECT_EQ(hex(record.build_config), "0123456789abcdef0123456789abcdef");
}

TEST(VersionsTableTest, AcceptsColumnsInAnyOrder) {
  constexpr std::string_view text{
      "VersionsName!String:0|BuildId!DEC:4|CDNConfig!HEX:16|Region!STRING:0|"
      "BuildConfig!HEX:16\n"
      "1.0.0.5|5|fedcba9876543210fedcba9876543210|kr|"
      "0123456789ABCDEF0123456789ABCDEF\n"};
  tek_tc_version_record record;
  const auto res{parse_versions(text, "kr", record)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(record.build_id, 5u);
  EXPECT_STREQ(record.version, "1.0.0.5");
  EXPECT_EQ(hex(record.build_config), "0123456789abcdef0123456789abcdef");
}

TEST(VersionsTableTest, ReportsMissingRegion) {
  tek_tc_version_record record;
  const auto res{parse_versions(versions_text, "cn", record)};
  EXPECT_EQ(res.type, TEK_TC_ERR_TYPE_sub);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_fetch_versions);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_no_matching_region);
}

TEST(VersionsTableTest, RejectsMissingColumns) {
  constexpr std::string_view text{"Region!STRING:0|BuildId!DEC:4\nus|1\n"};
  tek_tc_version_record record;
  const auto res{parse_versions(text, nullptr, record)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

TEST(VersionsTableTest, RejectsTableWithoutHeader) {
  tek_tc_version_record record;
  const auto res{parse_versions("## seqn = 1\n\n", nullptr, record)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

TEST(VersionsTableTest, RejectsMalformedHash) {
  constexpr std::string_view text{
      "Region!STRING:0|BuildConfig!HEX:16|CDNConfig!HEX:16|BuildId!DEC:4|"
      "VersionsName!String:0\n"
      "us|0123|fedcba9876543210fedcba9876543210|1|1.0\n"};
  tek_tc_version_record record;
  const auto res{parse_versions(text, nullptr, record)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_hash_parse);
}

TEST(VersionsTableTest, RejectsMalformedBuildId) {
  constexpr std::string_view text{
      "Region!STRING:0|BuildConfig!HEX:16|CDNConfig!HEX:16|BuildId!DEC:4|"
      "VersionsName!String:0\n"
      "us|0123456789abcdef0123456789abcdef|fedcba9876543210fedcba9876543210|"
      "12a|1.0\n"};
  tek_tc_version_record record;
  const auto res{parse_versions(text, nullptr, record)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

TEST(VersionsTableTest, RejectsFieldsTooLongToStore) {
  const std::string header{
      "Region!STRING:0|BuildConfig!HEX:16|CDNConfig!HEX:16|BuildId!DEC:4|"
      "VersionsName!String:0\n"};
  const std::string hashes{
      "|0123456789abcdef0123456789abcdef|fedcba9876543210fedcba9876543210|1|"};
  tek_tc_version_record record;
  // 63 characters fit along with the terminator, 64 do not
  auto res{parse_versions(header + "us" + hashes + std::string(63, '9'),
                          nullptr, record)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(std::string{record.version}, std::string(63, '9'));
  res = parse_versions(header + "us" + hashes + std::string(64, '9'), nullptr,
                       record);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_fetch_versions);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
  res = parse_versions(header + std::string(16, 'r') + hashes + "1.0",
                       nullptr, record);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

//===-- CDNs table --------------------------------------------------------===//

TEST(CdnsTableTest, SplitsHostsAndServers) {
  tek_tc_cdn_entry entry;
  const auto res{parse_cdns(cdns_text, "eu", entry)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_STREQ(entry.region, "eu");
  EXPECT_STREQ(entry.path, "tpr/wow");
  EXPECT_STREQ(entry.config_path, "tpr/configs/data");
  ASSERT_EQ(entry.num_hosts, 2);
  EXPECT_STREQ(entry.hosts[0], "eu.cdn.blizzard.com");
  EXPECT_STREQ(entry.hosts[1], "level3.blizzard.com");
  ASSERT_EQ(entry.num_servers, 2);
  EXPECT_STREQ(entry.servers[0], "http://eu.cdn.blizzard.com/?maxhosts=4");
  EXPECT_STREQ(entry.servers[1],
               "https://blzddist1-a.akamaihd.net/?fallback=1");
  tek_tc_cdn_release(&entry);
  EXPECT_EQ(entry.buf, nullptr);
}

TEST(CdnsTableTest, AcceptsCommaSeparatedHosts) {
  tek_tc_cdn_entry entry;
  const auto res{parse_cdns(cdns_text, "us", entry)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(entry.num_hosts, 2);
  EXPECT_STREQ(entry.hosts[1], "level3.blizzard.com");
  EXPECT_EQ(entry.num_servers, 0);
  EXPECT_EQ(entry.servers, nullptr);
  tek_tc_cdn_release(&entry);
}

TEST(CdnsTableTest, ReportsMissingRegion) {
  tek_tc_cdn_entry entry;
  const auto res{parse_cdns(cdns_text, "kr", entry)};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_fetch_cdns);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_no_matching_region);
}

TEST(CdnsTableTest, RejectsEntryWithoutEndpoints) {
  constexpr std::string_view text{
      "Name!STRING:0|Path!STRING:0|Hosts!STRING:0\nus|tpr/wow|\n"};
  tek_tc_cdn_entry entry;
  const auto res{parse_cdns(text, "us", entry)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

//===-- Build configuration -----------------------------------------------===//

TEST(BuildConfigTest, ParsesKeysAndSizes) {
  constexpr std::string_view text{
      "# Build Configuration\n"
      "\n"
      "root = 00000000000000000000000000000001\n"
      "install = 00000000000000000000000000000002 "
      "00000000000000000000000000000003\n"
      "install-size = 23038 22000\n"
      "download = 00000000000000000000000000000009\n"
      "encoding = 00000000000000000000000000000004 "
      "00000000000000000000000000000005\n"
      "encoding-size = 128000 127500\n"
      "build-name = WOW-61265patch11.2.0_Retail\n"};
  tek_tc_build_config config;
  const auto res{parse_bcfg(text, config)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(hex(config.root), "00000000000000000000000000000001");
  EXPECT_EQ(hex(config.install_ckey), "00000000000000000000000000000002");
  ASSERT_TRUE(config.has_install_ekey);
  EXPECT_EQ(hex(config.install_ekey), "00000000000000000000000000000003");
  EXPECT_EQ(config.install_size, 23038u);
  EXPECT_EQ(hex(config.encoding_ckey), "00000000000000000000000000000004");
  EXPECT_EQ(hex(config.encoding_ekey), "00000000000000000000000000000005");
  EXPECT_EQ(config.encoding_size, 128000u);
  ASSERT_NE(config.build_name, nullptr);
  EXPECT_STREQ(config.build_name, "WOW-61265patch11.2.0_Retail");
  tek_tc_bcfg_release(&config);
  EXPECT_EQ(config.build_name, nullptr);
}

TEST(BuildConfigTest, InstallEncodingKeyIsOptional) {
  constexpr std::string_view text{
      "install = 00000000000000000000000000000002\r\n"
      "encoding = 00000000000000000000000000000004 "
      "00000000000000000000000000000005\r\n"};
  tek_tc_build_config config;
  const auto res{parse_bcfg(text, config)};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_FALSE(config.has_install_ekey);
  EXPECT_EQ(config.build_name, nullptr);
  tek_tc_bcfg_release(&config);
}

TEST(BuildConfigTest, RequiresInstallAndEncoding) {
  tek_tc_build_config config;
  const auto res{
      parse_bcfg("root = 00000000000000000000000000000001\n", config)};
  EXPECT_EQ(res.type, TEK_TC_ERR_TYPE_sub);
  EXPECT_EQ(res.primary, TEK_TC_ERRC_build_config);
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

TEST(BuildConfigTest, RejectsEncodingWithoutEncodingKey) {
  tek_tc_build_config config;
  const auto res{
      parse_bcfg("install = 00000000000000000000000000000002\n"
                 "encoding = 00000000000000000000000000000004\n",
                 config)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_malformed_response);
}

TEST(BuildConfigTest, RejectsMalformedHash) {
  tek_tc_build_config config;
  const auto res{parse_bcfg("install = xyz\n", config)};
  EXPECT_EQ(res.auxiliary, TEK_TC_ERRC_hash_parse);
}

} // namespace
} // namespace tek::tactclient::test
