//===-- cdn.h - TACT version, CDN and content fetching API ----------------===//
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
/// Declarations of types and functions for resolving product versions and
///    CDN endpoints, and fetching content from CDN hosts.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "content.h"
#include "error.h"

#include <stdatomic.h>
#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// Record of the version table for a product and region.
typedef struct tek_tc_version_record tek_tc_version_record;
/// @copydoc tek_tc_version_record
struct tek_tc_version_record {
  /// Product code, as a null-terminated string.
  char product[32];
  /// Region name, as a null-terminated string.
  char region[16];
  /// Numeric build ID.
  uint32_t build_id;
  /// Version string, as a null-terminated string.
  char version[64];
  /// Hash of the build configuration file.
  tek_tc_hash build_config;
  /// Hash of the CDN configuration file.
  tek_tc_hash cdn_config;
};

/// Record of the CDN table for a product and region.
typedef struct tek_tc_cdn_entry tek_tc_cdn_entry;
/// @copydoc tek_tc_cdn_entry
struct tek_tc_cdn_entry {
  /// Pointer to the buffer holding all strings of the entry.
  void *_Nullable buf;
  /// Region name, as a null-terminated string.
  const char *_Nullable region;
  /// Path prefix for content on the hosts, as a null-terminated string
  ///    (e.g. `tpr/wow`).
  const char *_Nullable path;
  /// Path prefix for product configuration files, as a null-terminated
  ///    string.
  const char *_Nullable config_path;
  /// Number of entries pointed to by @ref hosts.
  int num_hosts;
  /// Pointer to the array of host names, in the order they should be tried.
  const char *_Nonnull const *_Nullable hosts;
  /// Number of entries pointed to by @ref servers.
  int num_servers;
  /// Pointer to the array of server URLs, which are tried after all
  ///    @ref hosts.
  const char *_Nonnull const *_Nullable servers;
};

/// Resolved build state of a product, used as input/output data for the
///    functions that fetch its content.
typedef struct tek_tc_build tek_tc_build;
/// @copydoc tek_tc_build
struct tek_tc_build {
  /// [In] Product code, as a null-terminated string.
  const char *_Nonnull product;
  /// [In] Optional region name, as a null-terminated string. `nullptr`
  ///    selects the first record of each table.
  const char *_Nullable region;
  /// [In] Optional version table text to use instead of fetching it.
  const char *_Nullable versions_text;
  /// [In] Size of @ref versions_text, in bytes.
  int versions_text_size;
  /// [In] Optional build configuration text to use instead of fetching it.
  const char *_Nullable config_text;
  /// [In] Size of @ref config_text, in bytes.
  int config_text_size;
  /// [Out] Resolved version record.
  tek_tc_version_record version;
  /// [Out] Resolved CDN entry.
  tek_tc_cdn_entry cdn;
  /// [Out] Parsed build configuration.
  tek_tc_build_config config;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===--- Table parsing ----------------------------------------------------===//

/// Select a record from version table text.
///
/// @param [in] text
///    Pointer to the table text.
/// @param size
///    Size of @p text, in bytes.
/// @param [in] product
///    Product code to store in @p record, as a null-terminated string.
/// @param [in] region
///    Optional region name to select the record for, as a null-terminated
///    string. `nullptr` selects the first record.
/// @param [out] record
///    Address of variable that receives the selected record on success.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3, 5), gnu::access(read_only, 1, 2),
  gnu::access(read_only, 3), gnu::access(read_only, 4),
  gnu::access(write_only, 5)]]
tek_tc_err tek_tc_versions_parse(const char *_Nonnull text, int size,
                                 const char *_Nonnull product,
                                 const char *_Nullable region,
                                 tek_tc_version_record *_Nonnull record);

/// Select an entry from CDN table text.
///
/// @param [in] text
///    Pointer to the table text.
/// @param size
///    Size of @p text, in bytes.
/// @param [in] region
///    Optional region name to select the entry for, as a null-terminated
///    string. `nullptr` selects the first entry.
/// @param [out] entry
///    Address of variable that receives the selected entry on success. It
///    must be released with @ref tek_tc_cdn_release after use.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 4), gnu::access(read_only, 1, 2),
  gnu::access(read_only, 3), gnu::access(write_only, 4)]]
tek_tc_err tek_tc_cdns_parse(const char *_Nonnull text, int size,
                             const char *_Nullable region,
                             tek_tc_cdn_entry *_Nonnull entry);

/// Release memory allocated for a CDN entry.
///
/// @param [in, out] entry
///    Pointer to the entry to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_cdn_release(tek_tc_cdn_entry *_Nonnull entry);

//===--- Resolution -------------------------------------------------------===//

/// Fetch the version table of a product and select a record from it.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] product
///    Product code, as a null-terminated string.
/// @param [in] region
///    Optional region name, as a null-terminated string.
/// @param [out] record
///    Address of variable that receives the selected record on success.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 4), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::access(write_only, 4), gnu::access(read_only, 5)]]
tek_tc_err tek_tc_resolve_version(tek_tc_lib_ctx *_Nonnull lib_ctx,
                                  const char *_Nonnull product,
                                  const char *_Nullable region,
                                  tek_tc_version_record *_Nonnull record,
                                  const atomic_bool *_Nullable cancel_flag);

/// Fetch the CDN table of a product and select an entry from it.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] product
///    Product code, as a null-terminated string.
/// @param [in] region
///    Optional region name, as a null-terminated string.
/// @param [out] entry
///    Address of variable that receives the selected entry on success. It
///    must be released with @ref tek_tc_cdn_release after use.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 4), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::access(write_only, 4), gnu::access(read_only, 5)]]
tek_tc_err tek_tc_resolve_cdn(tek_tc_lib_ctx *_Nonnull lib_ctx,
                              const char *_Nonnull product,
                              const char *_Nullable region,
                              tek_tc_cdn_entry *_Nonnull entry,
                              const atomic_bool *_Nullable cancel_flag);

//===--- CDN downloads ----------------------------------------------------===//

/// Fetch a file from CDN, trying hosts of the entry in order. The next host
///    is tried only after a transport failure (following retries) or a
///    non-success status from the current one.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] cdn
///    Pointer to the CDN entry providing hosts and path layout.
/// @param is_config
///    `true` to fetch from the `config` directory, `false` to fetch from the
///    `data` directory.
/// @param [in] key
///    Pointer to the hash of the file to fetch.
/// @param [out] data
///    Address of variable that receives pointer to the fetched data on
///    success. It must be freed with `free` after use.
/// @param [out] size
///    Address of variable that receives size of the fetched data on success.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation. On failure,
///    it's the error of the last host tried, with primary code
///    @ref TEK_TC_ERRC_fetch_config or @ref TEK_TC_ERRC_fetch_data.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 4, 5, 6), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 4),
  gnu::access(write_only, 5), gnu::access(write_only, 6),
  gnu::access(read_only, 7)]]
tek_tc_err tek_tc_cdn_fetch(tek_tc_lib_ctx *_Nonnull lib_ctx,
                            const tek_tc_cdn_entry *_Nonnull cdn,
                            bool is_config, const tek_tc_hash *_Nonnull key,
                            void *_Nullable *_Nonnull data, int *_Nonnull size,
                            const atomic_bool *_Nullable cancel_flag);

//===--- Build content ----------------------------------------------------===//

/// Resolve version record, CDN entry and build configuration of a product.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in, out] build
///    Pointer to the build state to resolve. On success, it must be released
///    with @ref tek_tc_build_release after use.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_write, 2), gnu::access(read_only, 3)]]
tek_tc_err tek_tc_build_resolve(tek_tc_lib_ctx *_Nonnull lib_ctx,
                                tek_tc_build *_Nonnull build,
                                const atomic_bool *_Nullable cancel_flag);

/// Fetch, decode and parse the install manifest of a resolved build.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] build
///    Pointer to the resolved build state.
/// @param [out] manifest
///    Address of variable that receives the parsed manifest on success. It
///    must be freed with @ref tek_tc_im_free after use.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3),
  gnu::access(read_only, 4)]]
tek_tc_err tek_tc_build_fetch_install(
    tek_tc_lib_ctx *_Nonnull lib_ctx, const tek_tc_build *_Nonnull build,
    tek_tc_install_manifest *_Nonnull manifest,
    const atomic_bool *_Nullable cancel_flag);

/// Fetch, decode and parse the encoding manifest of a resolved build.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] build
///    Pointer to the resolved build state.
/// @param [out] enc
///    Address of variable that receives the parsed manifest on success. It
///    must be freed with @ref tek_tc_enc_free after use.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3),
  gnu::access(read_only, 4)]]
tek_tc_err tek_tc_build_fetch_encoding(
    tek_tc_lib_ctx *_Nonnull lib_ctx, const tek_tc_build *_Nonnull build,
    tek_tc_encoding *_Nonnull enc, const atomic_bool *_Nullable cancel_flag);

/// Fetch and decode a file of a resolved build by its content key, verifying
///    that decoded content matches the key.
///
/// @param [in, out] lib_ctx
///    Pointer to the library context to use.
/// @param [in] build
///    Pointer to the resolved build state.
/// @param [in] enc
///    Optional pointer to the encoding manifest of the build. If `nullptr`,
///    the manifest is fetched by the function.
/// @param [in] ckey
///    Pointer to the content key of the file to fetch.
/// @param [out] data
///    Address of variable that receives pointer to the decoded data on
///    success. It must be freed with `free` after use.
/// @param [out] size
///    Address of variable that receives size of the decoded data on success.
/// @param [in] cancel_flag
///    Optional pointer to the flag that may be set by another thread to cancel
///    the operation.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 4, 5, 6), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::access(read_only, 4), gnu::access(write_only, 5),
  gnu::access(write_only, 6), gnu::access(read_only, 7)]]
tek_tc_err tek_tc_build_fetch_by_ckey(
    tek_tc_lib_ctx *_Nonnull lib_ctx, const tek_tc_build *_Nonnull build,
    const tek_tc_encoding *_Nullable enc, const tek_tc_hash *_Nonnull ckey,
    void *_Nullable *_Nonnull data, int *_Nonnull size,
    const atomic_bool *_Nullable cancel_flag);

/// Release memory allocated for a resolved build state.
///
/// @param [in, out] build
///    Pointer to the build state to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_build_release(tek_tc_build *_Nonnull build);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
