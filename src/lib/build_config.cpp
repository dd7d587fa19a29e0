//===-- build_config.cpp - build configuration parsing --------------------===//
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
/// Implementation of @ref tek_tc_bcfg_parse and @ref tek_tc_bcfg_release.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/content.h"

#include "common/error.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ranges>
#include <string_view>
#include <system_error>
#include <vector>

namespace tek::tactclient::content {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Create a build configuration parsing error.
tek_tc_err bcfg_err(tek_tc_errc errc) noexcept {
  return ttc_err_sub(TEK_TC_ERRC_build_config, errc);
}

/// Trim spaces, tabs and carriage returns at both ends of a string.
constexpr std::string_view trim(std::string_view str) noexcept {
  const auto begin{str.find_first_not_of(" \t\r")};
  if (begin == std::string_view::npos) {
    return {};
  }
  return str.substr(begin, str.find_last_not_of(" \t\r") - begin + 1);
}

/// Split a value into space-separated words.
std::vector<std::string_view> split_words(std::string_view value) {
  std::vector<std::string_view> res;
  for (const auto word : std::views::split(value, ' ')) {
    if (!word.empty()) {
      res.emplace_back(word.begin(), word.end());
    }
  }
  return res;
}

/// Parse a hash word.
bool parse_hash(std::string_view word, tek_tc_hash &hash) noexcept {
  return word.length() == 32 && ttci_u_str_to_hash(word.data(), &hash);
}

/// Parse a size word.
bool parse_size(std::string_view word, std::uint64_t &size) noexcept {
  const auto end{word.data() + word.length()};
  const auto res{std::from_chars(word.data(), end, size)};
  return res.ec == std::errc{} && res.ptr == end;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_bcfg_parse(const char *data, int size,
                             tek_tc_build_config *config) {
  tek_tc_build_config res{};
  bool has_install{};
  bool has_encoding{};
  std::string_view build_name;
  for (const auto line_range :
       std::views::split(std::string_view{data, static_cast<std::size_t>(size)},
                         '\n')) {
    const auto line{trim({line_range.begin(), line_range.end()})};
    if (line.empty() || line.starts_with('#')) {
      continue;
    }
    const auto eq{line.find('=')};
    if (eq == std::string_view::npos) {
      continue;
    }
    const auto key{trim(line.substr(0, eq))};
    const auto value{trim(line.substr(eq + 1))};
    if (key == "build-name") {
      build_name = value;
      continue;
    }
    const auto words{split_words(value)};
    if (key == "root") {
      if (words.empty() || !parse_hash(words[0], res.root)) {
        return bcfg_err(TEK_TC_ERRC_hash_parse);
      }
    } else if (key == "install") {
      if (words.empty() || !parse_hash(words[0], res.install_ckey)) {
        return bcfg_err(TEK_TC_ERRC_hash_parse);
      }
      if (words.size() > 1) {
        if (!parse_hash(words[1], res.install_ekey)) {
          return bcfg_err(TEK_TC_ERRC_hash_parse);
        }
        res.has_install_ekey = true;
      }
      has_install = true;
    } else if (key == "install-size") {
      if (words.empty() || !parse_size(words[0], res.install_size)) {
        return bcfg_err(TEK_TC_ERRC_malformed_response);
      }
    } else if (key == "encoding") {
      if (words.size() < 2) {
        return bcfg_err(TEK_TC_ERRC_malformed_response);
      }
      if (!parse_hash(words[0], res.encoding_ckey) ||
          !parse_hash(words[1], res.encoding_ekey)) {
        return bcfg_err(TEK_TC_ERRC_hash_parse);
      }
      has_encoding = true;
    } else if (key == "encoding-size") {
      if (words.empty() || !parse_size(words[0], res.encoding_size)) {
        return bcfg_err(TEK_TC_ERRC_malformed_response);
      }
    }
  }
  if (!has_install || !has_encoding) {
    return bcfg_err(TEK_TC_ERRC_malformed_response);
  }
  if (!build_name.empty()) {
    res.build_name =
        reinterpret_cast<char *>(std::malloc(build_name.length() + 1));
    if (!res.build_name) {
      return bcfg_err(TEK_TC_ERRC_mem_alloc);
    }
    std::memcpy(res.build_name, build_name.data(), build_name.length());
    res.build_name[build_name.length()] = '\0';
  }
  *config = res;
  return ttc_err_ok();
}

void tek_tc_bcfg_release(tek_tc_build_config *config) {
  std::free(config->build_name);
  config->build_name = nullptr;
}

} // extern "C"

} // namespace tek::tactclient::content
