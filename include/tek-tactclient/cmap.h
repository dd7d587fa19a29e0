//===-- cmap.h - CKey map API ---------------------------------------------===//
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
/// Declarations of types and functions for CKey map, a persisted index of
///    downloaded files by their content keys, stored as `.ckey_map.json` in
///    the destination directory.
///
/// The map holds at most one entry per content key, and at most one content
///    key per file path. All functions are thread-safe. There is no locking
///    between processes, concurrent processes using the same destination
///    directory will overwrite each other's changes.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"

//===-- Types -------------------------------------------------------------===//

/// Name of the CKey map file in the destination directory.
#define TEK_TC_CMAP_FILE_NAME ".ckey_map.json"

/// Opaque CKey map instance.
typedef struct tek_tc_cmap tek_tc_cmap;

/// CKey map entry.
typedef struct tek_tc_cmap_entry tek_tc_cmap_entry;
/// @copydoc tek_tc_cmap_entry
struct tek_tc_cmap_entry {
  /// Path to the file relative to the destination directory, with `/`
  ///    separators, as a heap-allocated null-terminated UTF-8 string.
  char *_Nullable path;
  /// Name of the product that the file belongs to, as a heap-allocated
  ///    null-terminated UTF-8 string.
  char *_Nullable product;
  /// Version of the product that the file belongs to, as a heap-allocated
  ///    null-terminated UTF-8 string.
  char *_Nullable version;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Load CKey map from a destination directory. Missing map file results in
///    an empty map, corrupted or unreadable one results in an empty map and a
///    warning.
///
/// @param [in] dir
///    Path to the destination directory, as a null-terminated string.
/// @param [out] warning
///    Optional address of variable that receives @ref TEK_TC_ERRC_cmap_corrupt
///    or an I/O error with @ref TEK_TC_ERRC_cmap_load primary code if the map
///    file couldn't be loaded, or success otherwise.
/// @return Pointer to the created map instance, or `nullptr` on memory
///    allocation failure. It must be destroyed with @ref tek_tc_cmap_destroy
///    after use.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::access(write_only, 2), gnu::null_terminated_string_arg(1)]]
tek_tc_cmap *_Nullable tek_tc_cmap_load(const char *_Nonnull dir,
                                        tek_tc_err *_Nullable warning);

/// Destroy a CKey map instance without saving it.
///
/// @param [in, out] cmap
///    Pointer to the map instance to destroy.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_cmap_destroy(tek_tc_cmap *_Nonnull cmap);

/// Get the number of entries in a CKey map.
///
/// @param [in, out] cmap
///    Pointer to the map instance.
/// @return Number of entries.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
int tek_tc_cmap_size(tek_tc_cmap *_Nonnull cmap);

/// Look up a content key in a CKey map.
///
/// @param [in, out] cmap
///    Pointer to the map instance.
/// @param [in] ckey
///    Pointer to the content key to look up.
/// @param [out] entry
///    Optional address of variable that receives a copy of the entry if it's
///    found. It must be released with @ref tek_tc_cmap_entry_release after
///    use.
/// @return Value indicating whether the content key was found.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3)]]
bool tek_tc_cmap_lookup(tek_tc_cmap *_Nonnull cmap,
                        const tek_tc_hash *_Nonnull ckey,
                        tek_tc_cmap_entry *_Nullable entry);

/// Find the content key mapped to a file path.
///
/// @param [in, out] cmap
///    Pointer to the map instance.
/// @param [in] path
///    Path relative to the destination directory, as a null-terminated
///    string. Backward slashes are treated as separators.
/// @param [out] ckey
///    Address of variable that receives the content key if it's found.
/// @return Value indicating whether @p path is mapped to a content key.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3),
  gnu::null_terminated_string_arg(2)]]
bool tek_tc_cmap_find_path(tek_tc_cmap *_Nonnull cmap,
                           const char *_Nonnull path,
                           tek_tc_hash *_Nonnull ckey);

/// Insert or replace the entry for a content key. Any other content key
///    mapped to the same path is removed.
///
/// @param [in, out] cmap
///    Pointer to the map instance.
/// @param [in] ckey
///    Pointer to the content key of the entry.
/// @param [in] entry
///    Pointer to the entry data, strings are copied. Backward slashes in
///    `path` are converted to forward ones.
/// @return Value indicating whether the map already had an entry for
///    @p ckey.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3)]]
bool tek_tc_cmap_insert(tek_tc_cmap *_Nonnull cmap,
                        const tek_tc_hash *_Nonnull ckey,
                        const tek_tc_cmap_entry *_Nonnull entry);

/// Remove the entry for a content key.
///
/// @param [in, out] cmap
///    Pointer to the map instance.
/// @param [in] ckey
///    Pointer to the content key to remove.
/// @return Value indicating whether an entry has been removed.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_only, 2)]]
bool tek_tc_cmap_remove(tek_tc_cmap *_Nonnull cmap,
                        const tek_tc_hash *_Nonnull ckey);

/// Save CKey map to its directory. The file is written to a temporary file
///    first that then replaces the map file.
///
/// @param [in, out] cmap
///    Pointer to the map instance to save.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
tek_tc_err tek_tc_cmap_save(tek_tc_cmap *_Nonnull cmap);

/// Release strings of a CKey map entry.
///
/// @param [in, out] entry
///    Pointer to the entry to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_cmap_entry_release(tek_tc_cmap_entry *_Nonnull entry);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
