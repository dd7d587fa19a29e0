//===-- tables.cpp - version and CDN table parsing ------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref tek_tc_versions_parse, @ref tek_tc_cdns_parse and
///    @ref tek_tc_cdn_release.
///
/// Both tables are pipe-separated text. The first non-comment line is the
///    header, where each column is described as `Name!TYPE:size`. Lines
///    starting with `#` (including the `## seqn` line) are comments.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/cdn.h"

#include "common/error.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tek::tactclient::cdn {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Parsed pipe-separated table. All views point into the source text.
struct psv_table {
  /// Column names, without type suffixes.
  std::vector<std::string_view> columns;
  /// Data rows, each having exactly as many fields as there are columns.
  std::vector<std::vector<std::string_view>> rows;

  /// Get index of a column.
  ///
  /// @param names
  ///    Accepted names of the column.
  /// @return Index of the first column matching any of @p names, or
  ///    `std::nullopt` if there is none.
  std::optional<std::size_t>
  find_column(std::initializer_list<std::string_view> names) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (std::ranges::find(names, columns[i]) != names.end()) {
        return i;
      }
    }
    return std::nullopt;
  }

  /// Select a row by region.
  ///
  /// @param region_col
  ///    Index of the region column.
  /// @param region
  ///    Region to select the row for, `nullptr` selects the first row.
  /// @return Pointer to the selected row, or `nullptr` if there is none.
  const std::vector<std::string_view> *_Nullable
  select(std::size_t region_col, const char *_Nullable region) const {
    if (!region) {
      return rows.empty() ? nullptr : &rows.front();
    }
    const auto it{std::ranges::find_if(rows, [region_col, region](auto &row) {
      return row[region_col] == region;
    })};
    return it == rows.end() ? nullptr : &*it;
  }
};

//===-- Private functions -------------------------------------------------===//

/// Split a line into pipe-separated fields, trimming carriage returns.
std::vector<std::string_view> split_fields(std::string_view line) {
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  std::vector<std::string_view> res;
  for (const auto field : std::views::split(line, '|')) {
    res.emplace_back(field.begin(), field.end());
  }
  return res;
}

/// Parse table text.
///
/// @param text
///    Table text to parse.
/// @param [out] table
///    Variable that receives the parsed table.
/// @return Value indicating whether the table has a header.
bool parse_table(std::string_view text, psv_table &table) {
  bool has_header{};
  for (const auto line_range : std::views::split(text, '\n')) {
    const std::string_view line{line_range.begin(), line_range.end()};
    if (line.empty() || line == "\r" || line.starts_with('#')) {
      continue;
    }
    auto fields{split_fields(line)};
    if (!has_header) {
      for (auto &field : fields) {
        field = field.substr(0, field.find('!'));
      }
      table.columns = std::move(fields);
      has_header = true;
      continue;
    }
    fields.resize(table.columns.size());
    table.rows.emplace_back(std::move(fields));
  }
  return has_header;
}

/// Copy a string into a fixed-size buffer.
///
/// @return Value indicating whether @p str fits into @p buf along with the
///    null terminator.
template <std::size_t N>
bool copy_str(char (&buf)[N], std::string_view str) noexcept {
  if (str.length() >= N) {
    return false;
  }
  std::memcpy(buf, str.data(), str.length());
  buf[str.length()] = '\0';
  return true;
}

/// Split a list of words separated by spaces or commas.
std::vector<std::string_view> split_list(std::string_view list) {
  std::vector<std::string_view> res;
  std::size_t pos{};
  while (pos < list.length()) {
    const auto begin{list.find_first_not_of(" ,", pos)};
    if (begin == std::string_view::npos) {
      break;
    }
    auto end{list.find_first_of(" ,", begin)};
    if (end == std::string_view::npos) {
      end = list.length();
    }
    res.emplace_back(list.substr(begin, end - begin));
    pos = end;
  }
  return res;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_versions_parse(const char *text, int size,
                                 const char *product, const char *region,
                                 tek_tc_version_record *record) {
  psv_table table;
  if (!parse_table({text, static_cast<std::size_t>(size)}, table)) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_versions,
                       TEK_TC_ERRC_malformed_response);
  }
  const auto region_col{table.find_column({"Region"})};
  const auto bcfg_col{table.find_column({"BuildConfig"})};
  const auto ccfg_col{table.find_column({"CDNConfig"})};
  const auto build_id_col{table.find_column({"BuildId"})};
  const auto version_col{table.find_column({"VersionsName", "VersionName"})};
  if (!region_col || !bcfg_col || !ccfg_col || !build_id_col ||
      !version_col) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_versions,
                       TEK_TC_ERRC_malformed_response);
  }
  const auto row{table.select(*region_col, region)};
  if (!row) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_versions,
                       TEK_TC_ERRC_no_matching_region);
  }
  tek_tc_version_record res{};
  const auto &bcfg{(*row)[*bcfg_col]};
  const auto &ccfg{(*row)[*ccfg_col]};
  if (bcfg.length() != 32 || !ttci_u_str_to_hash(bcfg.data(),
                                                 &res.build_config) ||
      ccfg.length() != 32 ||
      !ttci_u_str_to_hash(ccfg.data(), &res.cdn_config)) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_versions, TEK_TC_ERRC_hash_parse);
  }
  const auto &build_id{(*row)[*build_id_col]};
  if (!build_id.empty()) {
    const auto end{build_id.data() + build_id.length()};
    const auto conv_res{
        std::from_chars(build_id.data(), end, res.build_id)};
    if (conv_res.ec != std::errc{} || conv_res.ptr != end) {
      return ttc_err_sub(TEK_TC_ERRC_fetch_versions,
                         TEK_TC_ERRC_malformed_response);
    }
  }
  if (!copy_str(res.product, product) ||
      !copy_str(res.region, (*row)[*region_col]) ||
      !copy_str(res.version, (*row)[*version_col])) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_versions,
                       TEK_TC_ERRC_malformed_response);
  }
  *record = res;
  return ttc_err_ok();
}

tek_tc_err tek_tc_cdns_parse(const char *text, int size, const char *region,
                             tek_tc_cdn_entry *entry) {
  psv_table table;
  if (!parse_table({text, static_cast<std::size_t>(size)}, table)) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_cdns, TEK_TC_ERRC_malformed_response);
  }
  const auto name_col{table.find_column({"Name"})};
  const auto path_col{table.find_column({"Path"})};
  const auto hosts_col{table.find_column({"Hosts"})};
  const auto servers_col{table.find_column({"Servers"})};
  const auto config_path_col{table.find_column({"ConfigPath"})};
  if (!name_col || !path_col || !hosts_col) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_cdns, TEK_TC_ERRC_malformed_response);
  }
  const auto row{table.select(*name_col, region)};
  if (!row) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_cdns, TEK_TC_ERRC_no_matching_region);
  }
  const auto hosts{split_list((*row)[*hosts_col])};
  const auto servers{servers_col ? split_list((*row)[*servers_col])
                                 : std::vector<std::string_view>{}};
  if (hosts.empty() && servers.empty()) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_cdns, TEK_TC_ERRC_malformed_response);
  }
  const std::string_view name{(*row)[*name_col]};
  const std::string_view path{(*row)[*path_col]};
  const std::string_view config_path{
      config_path_col ? (*row)[*config_path_col] : std::string_view{}};
  // Compute buffer size: pointer arrays first, then all strings
  std::size_t buf_size{sizeof(const char *) * (hosts.size() + servers.size()) +
                       name.length() + path.length() + config_path.length() +
                       3};
  for (const auto &host : hosts) {
    buf_size += host.length() + 1;
  }
  for (const auto &server : servers) {
    buf_size += server.length() + 1;
  }
  const auto buf{std::malloc(buf_size)};
  if (!buf) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_cdns, TEK_TC_ERRC_mem_alloc);
  }
  const auto ptrs{reinterpret_cast<const char **>(buf)};
  auto next_str{
      reinterpret_cast<char *>(ptrs + hosts.size() + servers.size())};
  const auto copy{[&next_str](std::string_view str) {
    const auto res{next_str};
    std::memcpy(next_str, str.data(), str.length());
    next_str += str.length();
    *next_str++ = '\0';
    return res;
  }};
  for (std::size_t i = 0; i < hosts.size(); ++i) {
    ptrs[i] = copy(hosts[i]);
  }
  for (std::size_t i = 0; i < servers.size(); ++i) {
    ptrs[hosts.size() + i] = copy(servers[i]);
  }
  *entry = {.buf = buf,
            .region = copy(name),
            .path = copy(path),
            .config_path = copy(config_path),
            .num_hosts = static_cast<int>(hosts.size()),
            .hosts = hosts.empty() ? nullptr : ptrs,
            .num_servers = static_cast<int>(servers.size()),
            .servers = servers.empty() ? nullptr : ptrs + hosts.size()};
  return ttc_err_ok();
}

void tek_tc_cdn_release(tek_tc_cdn_entry *entry) {
  std::free(entry->buf);
  *entry = {};
}

} // extern "C"

} // namespace tek::tactclient::cdn
