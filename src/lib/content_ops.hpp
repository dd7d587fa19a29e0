//===-- content_ops.hpp - operators for content types ---------------------===//
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
/// Implementation of common operators for content types to be used by
///    library implementation modules.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/base.h"
#include "utils.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace tek::tactclient {

constexpr bool operator==(const tek_tc_hash &left,
                          const tek_tc_hash &right) noexcept {
  return std::ranges::equal(left.bytes, right.bytes);
}

/// Strict weak ordering of hashes by their bytes, for use as a map
///    comparator.
struct hash_less {
  constexpr bool operator()(const tek_tc_hash &left,
                            const tek_tc_hash &right) const noexcept {
    return std::ranges::lexicographical_compare(left.bytes, right.bytes);
  }
};

/// Get the canonical string representation of a hash.
///
/// @param [in] hash
///    Hash to convert.
/// @return Lowercase hexadecimal string.
inline std::string to_string(const tek_tc_hash &hash) {
  std::string res(32, '\0');
  ttci_u_hash_to_str(&hash, res.data());
  return res;
}

/// Compare raw bytes to a hash.
///
/// @param [in] bytes
///    Pointer to 16 bytes to compare.
/// @param [in] hash
///    Hash to compare with.
/// @return Value indicating whether the bytes are equal to @p hash.
[[gnu::nonnull(1), gnu::access(read_only, 1)]]
inline bool bytes_eq(const unsigned char *_Nonnull bytes,
                     const tek_tc_hash &hash) noexcept {
  return std::memcmp(bytes, hash.bytes, sizeof hash.bytes) == 0;
}

/// Convert backward slashes in a path to forward ones.
///
/// @param path
///    Path to convert.
/// @return Converted path.
inline std::string normalize_path(std::string_view path) {
  std::string res{path};
  std::ranges::replace(res, '\\', '/');
  return res;
}

} // namespace tek::tactclient
