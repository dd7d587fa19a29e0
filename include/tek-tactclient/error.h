//===-- error.h - TEK TACT Client error type and function declarations ----===//
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
/// Declarations of error-related types and functions used in TEK TACT Client.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"

//===-- Types -------------------------------------------------------------===//

/// TEK TACT Client error type values.
/// This type identifies the error domain and which fields in
///    @ref tek_tc_err are set, as well as their types. `primary` is set for all
///    error types.
enum tek_tc_err_type {
  /// Library internal error, only `primary` code is set.
  TEK_TC_ERR_TYPE_basic,
  /// Compound library internal error with a sub-operation defined by
  ///    `auxiliary` code, which has type @ref tek_tc_errc. BLTE integrity
  ///    errors also set `extra` to the index of the chunk that failed.
  TEK_TC_ERR_TYPE_sub,
  /// System call error, `auxiliary` code is an `errno` value. I/O errors also
  ///    set `extra` to a non-zero @ref tek_tc_err_io_type and `uri` to path to
  ///    the affected file.
  TEK_TC_ERR_TYPE_os,
  /// libcurl-easy interface error, `auxiliary` code is a `CURLcode`. `uri` may
  ///    be set to the URL of the failed request.
  TEK_TC_ERR_TYPE_curle,
  /// Server responded with a non-success status, `auxiliary` code is the HTTP
  ///    status code. `uri` may be set to the URL of the failed request.
  TEK_TC_ERR_TYPE_http
};
/// @copydoc tek_tc_err_type
typedef enum tek_tc_err_type tek_tc_err_type;

/// TEK TACT Client error codes.
enum tek_tc_errc {
  /// (0) Operation completed successfully.
  TEK_TC_ERRC_ok,
  /// (1) Every item of the batch has failed.
  TEK_TC_ERRC_all_failed,
  /// (2) Failed to decode a BLTE container.
  TEK_TC_ERRC_blte_decode,
  /// (3) Failed to parse build configuration.
  TEK_TC_ERRC_build_config,
  /// (4) The operation has been cancelled.
  TEK_TC_ERRC_cancelled,
  /// (5) MD5 checksum mismatch.
  TEK_TC_ERRC_checksum_mismatch,
  /// (6) CKey map file is corrupted, an empty map is used instead.
  TEK_TC_ERRC_cmap_corrupt,
  /// (7) Failed to load CKey map.
  TEK_TC_ERRC_cmap_load,
  /// (8) Failed to save CKey map.
  TEK_TC_ERRC_cmap_save,
  /// (9) Decoded content does not match its content key.
  TEK_TC_ERRC_content_mismatch,
  /// (10) curl_easy_init() returned nullptr.
  TEK_TC_ERRC_curle_init,
  /// (11) Content key is not present in the encoding manifest.
  TEK_TC_ERRC_ekey_not_found,
  /// (12) Failed to parse encoding manifest.
  TEK_TC_ERRC_encoding_parse,
  /// (13) Content is encrypted, decryption is not supported.
  TEK_TC_ERRC_encrypted_unsupported,
  /// (14) Failed to fetch CDN table.
  TEK_TC_ERRC_fetch_cdns,
  /// (15) Failed to fetch build configuration from CDN.
  TEK_TC_ERRC_fetch_config,
  /// (16) Failed to fetch data from CDN.
  TEK_TC_ERRC_fetch_data,
  /// (17) Failed to fetch encoding manifest.
  TEK_TC_ERRC_fetch_encoding,
  /// (18) Failed to fetch install manifest.
  TEK_TC_ERRC_fetch_install,
  /// (19) Failed to fetch version table.
  TEK_TC_ERRC_fetch_versions,
  /// (20) Invalid hexadecimal hash string.
  TEK_TC_ERRC_hash_parse,
  /// (21) Failed to build CKey map from directory contents.
  TEK_TC_ERRC_index_build,
  /// (22) Failed to parse install manifest.
  TEK_TC_ERRC_install_parse,
  /// (23) Encountered invalid data.
  TEK_TC_ERRC_invalid_data,
  /// (24) Invalid file name pattern.
  TEK_TC_ERRC_invalid_pattern,
  /// (25) JSON parsing error.
  TEK_TC_ERRC_json_parse,
  /// (26) Magic number mismatch (data corruption).
  TEK_TC_ERRC_magic_mismatch,
  /// (27) Server response is missing expected fields.
  TEK_TC_ERRC_malformed_response,
  /// (28) MD5 hashing error.
  TEK_TC_ERRC_md5,
  /// (29) Memory allocation error.
  TEK_TC_ERRC_mem_alloc,
  /// (30) The table has no record for requested region.
  TEK_TC_ERRC_no_matching_region,
  /// (31) BLTE container nesting is too deep.
  TEK_TC_ERRC_recursion_limit,
  /// (32) Decoded data size does not match the declared one.
  TEK_TC_ERRC_size_mismatch,
  /// (33) Transport error.
  TEK_TC_ERRC_transport,
  /// (34) Input ends before a field that it declares.
  TEK_TC_ERRC_truncated_input,
  /// (35) Unknown BLTE chunk encoding mode.
  TEK_TC_ERRC_unknown_mode,
  /// (36) Unknown product name.
  TEK_TC_ERRC_unknown_product,
  /// (37) Unsupported format version.
  TEK_TC_ERRC_unsupported_version,
  /// (38) Failed to write a file.
  TEK_TC_ERRC_write_failed,
  /// (39) Failed to start a worker thread.
  TEK_TC_ERRC_wt_start,
  /// (40) zlib decompression error.
  TEK_TC_ERRC_zlib
};
/// @copydoc tek_tc_errc
typedef enum tek_tc_errc tek_tc_errc;

/// Types of I/O operations that may fail.
enum tek_tc_err_io_type {
  /// Not an I/O operation.
  TEK_TC_ERR_IO_TYPE_none,
  /// Checking for existence of a pathname.
  TEK_TC_ERR_IO_TYPE_check_existence,
  /// Creating or opening a file or directory.
  TEK_TC_ERR_IO_TYPE_open,
  /// Getting file size.
  TEK_TC_ERR_IO_TYPE_get_size,
  /// Reading data from a file.
  TEK_TC_ERR_IO_TYPE_read,
  /// Writing data to a file.
  TEK_TC_ERR_IO_TYPE_write,
  /// Moving a file.
  TEK_TC_ERR_IO_TYPE_move,
  /// Deleting a file.
  TEK_TC_ERR_IO_TYPE_delete,
  /// Reading directory entries.
  TEK_TC_ERR_IO_TYPE_read_dir
};
/// @copydoc tek_tc_err_io_type
typedef enum tek_tc_err_io_type tek_tc_err_io_type;

/// TEK TACT Client error description structure.
typedef struct tek_tc_err tek_tc_err;
/// @copydoc tek_tc_err
struct tek_tc_err {
  // Type of the error. Defines which fields are set.
  tek_tc_err_type type;
  /// Primary error code. Defines the outermost operation that has failed.
  tek_tc_errc primary;
  /// Auxiliary error code, the value and type depend on @ref type.
  int auxiliary;
  /// Extra information value, the value and type depend on @ref type.
  int extra;
  /// May be set by certain errors to provide a file path or a URL, as a
  ///    null-terminated UTF-8 string.
  /// If set, must be freed with `free` after use.
  const char *_Nullable uri;
};

/// Human-readable messages for @ref tek_tc_err fields.
typedef struct tek_tc_err_msgs tek_tc_err_msgs;
/// @copydoc tek_tc_err_msgs
struct tek_tc_err_msgs {
  // Type of the error that the messages were produced for.
  tek_tc_err_type type;
  /// String representation of @ref type.
  const char *_Nonnull type_str;
  /// Message for the primary error code.
  const char *_Nonnull primary;
  /// Message for the auxiliary error code, if the error has one.
  const char *_Nullable auxiliary;
  /// Message for the extra error code, if the error has one.
  const char *_Nullable extra;
  /// Message identifying type of string that `uri` refers to.
  const char *_Nullable uri_type;
};

//===-- Functions ---------------------------------------------------------===//

/// Check whether specified error structure indicates success.
///
/// @param [in] err
///    Pointer to the error structure to examine.
/// @return Value indicating whether @p err indicates success.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline bool tek_tc_err_success(const tek_tc_err *_Nonnull err) {
  return err->primary == TEK_TC_ERRC_ok;
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get human-readable messages for specified error structure.
///
/// @param [in] err
///    Pointer to the error structure to get messages for.
/// @return A structure containing messages for the error structure fields. It
///    must be released with @ref tek_tc_err_release_msgs after use.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_tc_err_msgs tek_tc_err_get_msgs(const tek_tc_err *_Nonnull err);

/// Release error messages.
///
/// @param [in, out] err_msgs
///    Pointer to the error messages structure to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_err_release_msgs(tek_tc_err_msgs *_Nonnull err_msgs);

/// Free the `uri` string of an error structure, if it's set.
///
/// @param [in, out] err
///    Pointer to the error structure to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_err_release(tek_tc_err *_Nonnull err);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
