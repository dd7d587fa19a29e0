//===-- base.h - basic TEK TACT Client declarations -----------------------===//
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
/// Declarations of TEK TACT Client's basic macros, types and functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <stdint.h>

//===-- Compiler macros ---------------------------------------------------===//

#ifndef __clang__
// Clang nullability attributes are replaced with mock macros for other
//    compilers.

#ifndef _Nullable
#define _Nullable
#endif // ndef _Nullable
#ifndef _Nonnull
#define _Nonnull
#endif // ndef _Nonnull
#ifndef _Null_unspecified
#define _Null_unspecified
#endif // ndef _Null_unspecified

#endif // ndef __clang__

// Public API attribute.
#define TEK_TC_API visibility("default")

// Declarations below return error structures, which are completed by
//    error.h either right away or after this header if it was included first.
typedef struct tek_tc_err tek_tc_err;
#include "error.h" // IWYU pragma: export

//===-- Common types ------------------------------------------------------===//

/// 16-byte TACT hash, used both as content key (CKey, MD5 of decoded file
///    content) and as encoding key (EKey, identifying the stored BLTE blob).
typedef struct tek_tc_hash tek_tc_hash;
/// @copydoc tek_tc_hash
struct tek_tc_hash {
  /// Raw hash bytes.
  unsigned char bytes[16];
};

/// Response of a transport request.
typedef struct tek_tc_transport_resp tek_tc_transport_resp;
/// @copydoc tek_tc_transport_resp
struct tek_tc_transport_resp {
  /// HTTP status code of the response.
  int status;
  /// Pointer to the buffer containing response body, may be `nullptr` if the
  ///    body is empty. Must be allocated with `malloc`, the library frees it
  ///    with `free`.
  void *_Nullable data;
  /// Size of the buffer pointed to by @ref data, in bytes.
  int size;
};

/// Prototype of transport function, performing a single HTTP GET request
///    without any retries.
///
/// @param [in, out] user_data
///    User data pointer that was passed to @ref tek_tc_lib_set_transport.
/// @param [in] url
///    URL to request, as a null-terminated UTF-8 string.
/// @param timeout_ms
///    Timeout for the request, in milliseconds.
/// @param [out] resp
///    Address of variable that receives the response on success. Any status
///    code received from the server counts as success.
/// @return A @ref tek_tc_err indicating the result of operation. Errors are
///    treated as transient and may be retried by the library.
typedef tek_tc_err tek_tc_transport_func(void *_Nullable user_data,
                                         const char *_Nonnull url,
                                         long timeout_ms,
                                         tek_tc_transport_resp *_Nonnull resp);

/// Library context configuration. Zero values of any field select its
///    default.
typedef struct tek_tc_lib_cfg tek_tc_lib_cfg;
/// @copydoc tek_tc_lib_cfg
struct tek_tc_lib_cfg {
  /// Base URL of the patch service providing version and CDN tables, without
  ///    trailing slash. Defaults to `http://us.patch.battle.net:1119`.
  const char *_Nullable patch_url;
  /// Timeout for a single request, in milliseconds. Defaults to 60000.
  long timeout_ms;
  /// Maximum number of retries of the same URL after a transient transport
  ///    failure. Defaults to 2, negative values disable retries.
  int max_retries;
  /// Delay before the first retry, in milliseconds, doubled for each
  ///    subsequent one. Defaults to 500.
  long retry_backoff_ms;
  /// Maximum number of worker threads for batch operations. Defaults to the
  ///    number of logical processors, but no more than 8.
  int num_threads;
  /// Value indicating whether CDN content should be requested over plain
  ///    HTTP instead of HTTPS.
  bool use_http;
};

//===-- Library context ---------------------------------------------------===//

/// Opaque TEK TACT Client library context.
/// This context holds configuration and the transport used by all network
///    operations.
typedef struct tek_tc_lib_ctx tek_tc_lib_ctx;

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Initialize TEK TACT Client library context.
///
/// @param [in] cfg
///    Optional pointer to the configuration to use. Strings are copied.
/// @return Pointer to the created library context that can be passed to other
///    functions. It must be cleaned up with @ref tek_tc_lib_cleanup after use.
///    `nullptr` may be returned on failure, which may be caused by libcurl
///    failing to initialize.
[[gnu::TEK_TC_API, gnu::access(read_only, 1)]] tek_tc_lib_ctx *_Nullable
tek_tc_lib_init(const tek_tc_lib_cfg *_Nullable cfg);

/// Cleanup TEK TACT Client library context.
///
/// @param [in, out] ctx
///    Pointer to the library context to clean up.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_lib_cleanup(tek_tc_lib_ctx *_Nonnull ctx);

/// Replace the transport used by the library context. Must not be called
///    while any operation is using the context.
///
/// @param [in, out] ctx
///    Pointer to the library context to modify.
/// @param [in] func
///    Pointer to the transport function, `nullptr` restores the default
///    libcurl-based transport.
/// @param [in] user_data
///    Pointer that will be passed to @p func.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_lib_set_transport(tek_tc_lib_ctx *_Nonnull ctx,
                              tek_tc_transport_func *_Nullable func,
                              void *_Nullable user_data);

/// Get the version of TEK TACT Client library.
///
/// @return Pointer to the statically allocated null-terminated version string.
[[gnu::TEK_TC_API,
  gnu::returns_nonnull]] const char *_Nonnull tek_tc_version(void);

//===-- Hash functions ----------------------------------------------------===//

/// Parse a hash from its hexadecimal representation.
///
/// @param [in] str
///    Pointer to the string to parse. Both lowercase and uppercase digits are
///    accepted.
/// @param len
///    Length of @p str, must be exactly 32 for the parse to succeed.
/// @param [out] hash
///    Address of variable that receives the hash on success.
/// @return A @ref tek_tc_err indicating the result of operation,
///    @ref TEK_TC_ERRC_hash_parse on invalid input.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
tek_tc_err tek_tc_hash_parse(const char *_Nonnull str, int len,
                             tek_tc_hash *_Nonnull hash);

/// Convert a hash to its canonical lowercase hexadecimal representation.
///
/// @param [in] hash
///    Pointer to the hash to convert.
/// @param [out] str
///    Pointer to the buffer that receives the resulting string, including
///    terminating null character.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
void tek_tc_hash_to_str(const tek_tc_hash *_Nonnull hash,
                        char str[_Nonnull 33]);

//===-- Product names -----------------------------------------------------===//

/// Get the product code for a product name.
///
/// @param [in] name
///    Friendly product name (e.g. `wow-classic`), case-insensitive, or a
///    product code as is (e.g. `wow_classic`), as a null-terminated string.
/// @return Pointer to the statically allocated product code string, or
///    `nullptr` if @p name is not a known product.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
const char *_Nullable tek_tc_product_code(const char *_Nonnull name);

/// Get the list of known friendly product names, which is also the default
///    product set for @ref tek_tc_grab.
///
/// @param [out] num_names
///    Address of variable that receives the number of names.
/// @return Pointer to the statically allocated array of null-terminated
///    product names.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(write_only, 1),
  gnu::returns_nonnull]]
const char *_Nonnull const *_Nonnull tek_tc_product_names(
    int *_Nonnull num_names);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
