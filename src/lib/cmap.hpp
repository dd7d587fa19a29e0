//===-- cmap.hpp - CKey map internal definitions --------------------------===//
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
/// Definition of @ref tek_tc_cmap and declarations of functions operating on
///    it without locking, for callers that hold @ref tek_tc_cmap::mtx across
///    several operations.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/cmap.h"

#include "content_ops.hpp"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tek::tactclient::cmap {

/// Name prefix of temporary files written next to destination files.
inline constexpr std::string_view tmp_prefix{".ttc-"};
/// Name suffix of temporary files, including the map's own one.
inline constexpr std::string_view tmp_suffix{".tmp"};

/// CKey map record.
struct record {
  /// Path to the file relative to the destination directory, with `/`
  ///    separators.
  std::string path;
  /// Name of the product that the file belongs to.
  std::string product;
  /// Version of the product that the file belongs to.
  std::string version;
};

} // namespace tek::tactclient::cmap

/// @copydoc tek_tc_cmap
struct tek_tc_cmap {
  /// Path to the destination directory.
  std::string dir;
  /// Records by content key, ordered by key bytes which matches the order of
  ///    their hexadecimal strings.
  std::map<tek_tc_hash, tek::tactclient::cmap::record,
           tek::tactclient::hash_less>
      records;
  /// Content keys by record paths.
  std::unordered_map<std::string, tek_tc_hash> paths;
  /// Mutex locking concurrent access to the map.
  std::shared_mutex mtx;
};

namespace tek::tactclient::cmap {

/// Find record for a content key. The caller must hold a lock.
///
/// @param [in] cmap
///    Map instance to search.
/// @param [in] ckey
///    Content key to look up.
/// @return Pointer to the record, or `nullptr` if there is none.
const record *_Nullable find(const tek_tc_cmap &cmap, const tek_tc_hash &ckey);

/// Find content key mapped to a path. The caller must hold a lock.
///
/// @param [in] cmap
///    Map instance to search.
/// @param [in] path
///    Normalized relative path.
/// @return The content key, or `std::nullopt` if the path is not mapped.
std::optional<tek_tc_hash> find_path(const tek_tc_cmap &cmap,
                                     const std::string &path);

/// Insert or replace a record, removing other content keys mapped to the same
///    path. The caller must hold an exclusive lock.
///
/// @param [in, out] cmap
///    Map instance to modify.
/// @param [in] ckey
///    Content key of the record.
/// @param rec
///    Record to insert, its path must be normalized.
/// @return Value indicating whether the map already had a record for @p ckey.
bool insert(tek_tc_cmap &cmap, const tek_tc_hash &ckey, record rec);

/// Remove the record for a content key. The caller must hold an exclusive
///    lock.
///
/// @param [in, out] cmap
///    Map instance to modify.
/// @param [in] ckey
///    Content key of the record to remove.
/// @return Value indicating whether a record has been removed.
bool remove(tek_tc_cmap &cmap, const tek_tc_hash &ckey);

/// Write the map to its file. The caller must hold a lock.
///
/// @param [in] cmap
///    Map instance to save.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err save(const tek_tc_cmap &cmap);

} // namespace tek::tactclient::cmap
