//===-- grab.h - bulk content retrieval API -------------------------------===//
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
/// Declarations of types and functions for grabbing install manifest files
///    that match name patterns from multiple products into a destination
///    directory, and for indexing previously downloaded files.
///
/// Files are placed at `{dest}/{product}/{version}/{path}`. Content keys of
///    written files are recorded in the destination's CKey map, so that
///    subsequent runs skip them. If the destination path is already occupied
///    by a file with different content, the new file is named
///    `{name}.{key}{ext}`, where `{name}` is the full original file name,
///    `{key}` is the first 8 characters of its content key (or the whole key
///    if that name is taken as well), and `{ext}` is the original extension,
///    if any. E.g. `Wow.exe` becomes `Wow.exe.605f3a54.exe`.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"

#include <stdatomic.h>
#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// States of a grab item. Terminal states are marked as such.
enum tek_tc_grab_state {
  /// The item has passed the pattern filter and is waiting to be processed.
  TEK_TC_GRAB_STATE_pending,
  /// (Terminal) The content key is in the CKey map and its file exists.
  TEK_TC_GRAB_STATE_skipped,
  /// Downloading the item from CDN.
  TEK_TC_GRAB_STATE_fetching,
  /// (Terminal) All CDN hosts failed to provide the item.
  TEK_TC_GRAB_STATE_fetch_failed,
  /// The item has been downloaded.
  TEK_TC_GRAB_STATE_fetched,
  /// Decoding downloaded BLTE container.
  TEK_TC_GRAB_STATE_decoding,
  /// (Terminal) Decoding has failed.
  TEK_TC_GRAB_STATE_decode_failed,
  /// The item has been decoded.
  TEK_TC_GRAB_STATE_decoded,
  /// Writing the file and updating the CKey map.
  TEK_TC_GRAB_STATE_writing,
  /// (Terminal) Writing has failed, the CKey map hasn't been changed.
  TEK_TC_GRAB_STATE_write_failed,
  /// (Terminal) The file has been written and recorded in the CKey map.
  TEK_TC_GRAB_STATE_written
};
/// @copydoc tek_tc_grab_state
typedef enum tek_tc_grab_state tek_tc_grab_state;

/// Outcome record of a single install manifest entry.
typedef struct tek_tc_grab_item tek_tc_grab_item;
/// @copydoc tek_tc_grab_item
struct tek_tc_grab_item {
  /// Path of the file in the install manifest, as a null-terminated string.
  const char *_Nonnull path;
  /// Content key of the file.
  tek_tc_hash ckey;
  /// Encoding key of the file, valid if the item has reached
  ///    @ref TEK_TC_GRAB_STATE_fetching.
  tek_tc_hash ekey;
  /// Size of the file, in bytes.
  uint32_t size;
  /// Current state of the item.
  tek_tc_grab_state state;
  /// Value indicating whether the file has been written under a
  ///    disambiguated name due to a path collision.
  bool renamed;
  /// For @ref TEK_TC_GRAB_STATE_written and @ref TEK_TC_GRAB_STATE_skipped,
  ///    path to the file relative to the destination directory, as a
  ///    heap-allocated null-terminated string.
  char *_Nullable dest_path;
  /// Result of processing the item. Items that have not been started due to
  ///    cancellation stay in @ref TEK_TC_GRAB_STATE_pending with
  ///    @ref TEK_TC_ERRC_cancelled result.
  tek_tc_err result;
};

/// Outcome record of a product.
typedef struct tek_tc_grab_product tek_tc_grab_product;
/// @copydoc tek_tc_grab_product
struct tek_tc_grab_product {
  /// Product name as specified in the input, as a null-terminated string.
  const char *_Nonnull name;
  /// Product code, or `nullptr` if the name is unknown.
  const char *_Nullable code;
  /// Resolved version string, as a null-terminated string. Empty if
  ///    resolution has failed.
  char version[64];
  /// Result of resolving the product and fetching its manifests.
  tek_tc_err result;
  /// Number of entries pointed to by @ref items.
  int num_items;
  /// Pointer to the array of outcome records for manifest entries that
  ///    passed the pattern filter, in manifest order.
  tek_tc_grab_item *_Nullable items;
};

typedef struct tek_tc_grab_desc tek_tc_grab_desc;

/// Prototype of grab item handler function. Calls are serialized.
///
/// @param [in, out] desc
///    Pointer to the descriptor of the running operation.
/// @param [in] product
///    Pointer to the product that the item belongs to.
/// @param [in] item
///    Pointer to the item that has reached a terminal state.
typedef void tek_tc_grab_item_func(tek_tc_grab_desc *_Nonnull desc,
                                   const tek_tc_grab_product *_Nonnull product,
                                   const tek_tc_grab_item *_Nonnull item);

/// Prototype of grab product handler function. Calls are serialized.
///
/// @param [in, out] desc
///    Pointer to the descriptor of the running operation.
/// @param [in] product
///    Pointer to the product that has been resolved, or has failed to.
typedef void
tek_tc_grab_product_func(tek_tc_grab_desc *_Nonnull desc,
                         const tek_tc_grab_product *_Nonnull product);

/// Grab operation descriptor, holding its input and output data.
struct tek_tc_grab_desc {
  /// [In] Optional pointer to the array of product names (friendly names or
  ///    codes). `nullptr` selects all known products.
  const char *_Nonnull const *_Nullable products;
  /// [In] Number of entries pointed to by @ref products.
  int num_products;
  /// [In] Optional pointer to the array of case-insensitive ECMAScript regular
  ///    expressions, a manifest entry is grabbed if its path matches any of
  ///    them. `nullptr` selects `\.pdb$` and `_loader\.dll$`.
  const char *_Nonnull const *_Nullable patterns;
  /// [In] Number of entries pointed to by @ref patterns.
  int num_patterns;
  /// [In] Path to the destination directory, as a null-terminated string.
  ///    The directory is created if it doesn't exist.
  const char *_Nonnull dest;
  /// [In] Optional region name, as a null-terminated string.
  const char *_Nullable region;
  /// [In] Value indicating whether files present in the CKey map should be
  ///    downloaded and written again.
  bool overwrite;
  /// [In] Optional pointer to the item handler function.
  tek_tc_grab_item_func *_Nullable item_handler;
  /// [In] Optional pointer to the product handler function.
  tek_tc_grab_product_func *_Nullable product_handler;
  /// [In] Arbitrary pointer for use by handlers.
  void *_Nullable user_data;
  /// [Out] Pointer to the array of product outcome records, in input order.
  tek_tc_grab_product *_Nullable results;
  /// [Out] Number of entries pointed to by @ref results.
  int num_results;
  /// [Out] Number of items in @ref TEK_TC_GRAB_STATE_written state.
  int num_written;
  /// [Out] Number of items in @ref TEK_TC_GRAB_STATE_skipped state.
  int num_skipped;
  /// [Out] Number of items in failed terminal states.
  int num_failed;
  /// [Out] Warning produced when loading CKey map.
  tek_tc_err cmap_warning;
};

/// Index operation descriptor, holding its input and output data.
typedef struct tek_tc_index_desc tek_tc_index_desc;
/// @copydoc tek_tc_index_desc
struct tek_tc_index_desc {
  /// [In] Path to the directory to index, as a null-terminated string.
  const char *_Nonnull dir;
  /// [In] Optional path to the destination directory where the CKey map is
  ///    saved, as a null-terminated string. `nullptr` selects @ref dir.
  const char *_Nullable dest;
  /// [In] Optional path to the directory that file paths are taken relative
  ///    to, as a null-terminated string. Its first path component is the
  ///    product name, the second is the version. `nullptr` selects
  ///    @ref dest. Files outside of it are taken relative to @ref dir.
  const char *_Nullable base_dir;
  /// [Out] Number of files that have been indexed.
  int num_indexed;
  /// [Out] Number of files that have been skipped.
  int num_skipped;
  /// [Out] Total number of entries in the saved CKey map.
  int num_entries;
  /// [Out] Warning produced when loading CKey map.
  tek_tc_err cmap_warning;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Grab files matching patterns from the install manifests of the products.
///    Failures of individual products and items are recorded in their outcome
///    records and don't stop processing of others.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in, out] desc
///    Pointer to the operation descriptor. Its output fields must be released
///    with @ref tek_tc_grab_release after use, regardless of the result.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation. Items being written are completed before returning.
/// @return A @ref tek_tc_err indicating the result of operation.
///    @ref TEK_TC_ERRC_all_failed is returned if every product has failed, or
///    every item that has been attempted has failed.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_write, 2), gnu::access(read_only, 3)]]
tek_tc_err tek_tc_grab(tek_tc_lib_ctx *_Nonnull lib_ctx,
                       tek_tc_grab_desc *_Nonnull desc,
                       const atomic_bool *_Nullable cancel_flag);

/// Release output data of a grab operation descriptor.
///
/// @param [in, out] desc
///    Pointer to the descriptor to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_grab_release(tek_tc_grab_desc *_Nonnull desc);

/// Index all files in a directory by their MD5 hashes (content keys) into
///    the CKey map of the destination directory.
///
/// @param [in, out] desc
///    Pointer to the operation descriptor.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation. Files indexed before cancellation are saved.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1),
  gnu::access(read_only, 2)]]
tek_tc_err tek_tc_build_index(tek_tc_index_desc *_Nonnull desc,
                              const atomic_bool *_Nullable cancel_flag);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
