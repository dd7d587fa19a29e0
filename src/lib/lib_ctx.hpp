//===-- lib_ctx.hpp - library context internal definitions ----------------===//
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
/// Definition of @ref tek_tc_lib_ctx and declarations of internal functions
///    that perform HTTP requests through it.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/base.h"

#include "tek-tactclient/error.h"

#include <cstdlib>
#include <memory>
#include <stdatomic.h>
#include <string>

/// @copydoc tek_tc_lib_ctx
struct tek_tc_lib_ctx {
  /// Base URL of the patch service, without trailing slash.
  std::string patch_url;
  /// Timeout for each request, in milliseconds.
  long timeout_ms;
  /// Number of times a request is repeated after a transport failure.
  int max_retries;
  /// Delay before the first repetition, in milliseconds. Doubles after each
  ///    one.
  long retry_backoff_ms;
  /// The maximum number of worker threads used by batch operations.
  int num_threads;
  /// Value indicating whether CDN hosts should be accessed via plain HTTP.
  bool use_http;
  /// Pointer to the function performing HTTP GET requests.
  tek_tc_transport_func *_Nonnull transport;
  /// Pointer passed to @ref transport.
  void *_Nullable transport_data;
};

namespace tek::tactclient {

/// Owning pointer to a buffer allocated with `malloc`.
using unique_buf = std::unique_ptr<void, decltype(&std::free)>;

/// Check whether cancellation has been requested.
///
/// @param [in] cancel_flag
///    Optional pointer to the cancellation flag.
/// @return Value indicating whether @p cancel_flag is set.
inline bool is_cancelled(const atomic_bool *_Nullable cancel_flag) noexcept {
  return cancel_flag &&
         atomic_load_explicit(cancel_flag, memory_order_relaxed);
}

/// Default transport function that uses libcurl.
///
/// @param [in] user_data
///    Unused.
/// @param [in] url
///    URL to request, as a null-terminated string.
/// @param timeout_ms
///    Timeout for the request, in milliseconds.
/// @param [out] resp
///    Address of variable that receives response status and body.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err curl_transport(void *_Nullable user_data, const char *_Nonnull url,
                          long timeout_ms,
                          tek_tc_transport_resp *_Nonnull resp);

/// Perform an HTTP GET request, repeating it after transport failures
///    according to library context's retry settings. Non-success HTTP status
///    is not a transport failure and is returned immediately.
///
/// @param [in] lib_ctx
///    Library context providing the transport and retry settings.
/// @param [in] url
///    URL to request.
/// @param prim
///    Primary error code for returned errors.
/// @param [out] body
///    Variable that receives the response body on success.
/// @param [out] size
///    Variable that receives size of the response body on success.
/// @param [in] cancel_flag
///    Optional pointer to the cancellation flag, checked before each attempt.
/// @return A @ref tek_tc_err indicating the result of operation. For
///    non-success statuses it has @ref TEK_TC_ERR_TYPE_http type with status
///    in `auxiliary`.
tek_tc_err fetch_url(const tek_tc_lib_ctx &lib_ctx, const std::string &url,
                     tek_tc_errc prim, unique_buf &body, int &size,
                     const atomic_bool *_Nullable cancel_flag);

/// Create a heap-allocated copy of a string for @ref tek_tc_err::uri.
///
/// @param str
///    String to copy.
/// @return Pointer to the copy, or `nullptr` if allocation fails.
char *_Nullable copy_uri(const std::string &str) noexcept;

} // namespace tek::tactclient
