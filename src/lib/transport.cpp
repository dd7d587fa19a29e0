//===-- transport.cpp - HTTP requests -------------------------------------===//
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
/// Implementation of the default libcurl transport and the retrying request
///    function built on top of the configured transport.
///
//===----------------------------------------------------------------------===//
#include "lib_ctx.hpp"

#include "common/error.h"
#include "config.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <curl/curl.h>
#include <memory>
#include <stdatomic.h>
#include <string>
#include <thread>
#include <utility>

namespace tek::tactclient {

namespace {

//===-- Private constant --------------------------------------------------===//

/// Granularity of cancellation checks during retry backoff, in milliseconds.
static constexpr long backoff_slice_ms = 50;

//===-- Private type ------------------------------------------------------===//

/// Download context for curl.
struct ttc_curl_ctx {
  /// curl easy handle that performs the download.
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl =
      std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl_easy_init(),
                                                          curl_easy_cleanup);
  /// Buffer storing downloaded content.
  std::string buf;
  /// Value indicating whether the content exceeds the maximum body size.
  bool too_large = false;
};

//===-- Private functions -------------------------------------------------===//

/// curl write data callback that copies downloaded data to the context
/// buffer.
///
/// @param [in] buf
///    Pointer to the buffer containing downloaded content chunk.
/// @param size
///    Size of the content chunk, in bytes.
/// @param [in, out] ctx
///    Download context.
/// @return @p size, or `0` if the content exceeds `INT_MAX` bytes.
[[using gnu: nonnull(1), access(read_only, 1, 3)]]
static std::size_t ttc_curl_write(const char *_Nonnull buf, std::size_t,
                                  std::size_t size, ttc_curl_ctx &ctx) {
  if (ctx.buf.empty()) {
    // This block is called only once, on first write
    // Get content length to do initial allocation
    if (curl_off_t content_len;
        curl_easy_getinfo(ctx.curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &content_len) == CURLE_OK &&
        content_len >= 0) {
      if (content_len > INT_MAX) {
        ctx.too_large = true;
        return 0;
      }
      ctx.buf.reserve(content_len);
    }
  }
  if (size > INT_MAX - ctx.buf.size()) {
    ctx.too_large = true;
    return 0;
  }
  ctx.buf.append(buf, size);
  return size;
}

/// Sleep for specified amount of time, waking up periodically to check for
///    cancellation.
///
/// @param duration_ms
///    Time to sleep for, in milliseconds.
/// @param [in] cancel_flag
///    Optional pointer to the cancellation flag.
/// @return Value indicating whether the sleep has completed without
///    cancellation.
static bool backoff_sleep(long duration_ms,
                          const atomic_bool *_Nullable cancel_flag) {
  while (duration_ms > 0) {
    if (is_cancelled(cancel_flag)) {
      return false;
    }
    const auto slice{std::min(duration_ms, backoff_slice_ms)};
    std::this_thread::sleep_for(std::chrono::milliseconds(slice));
    duration_ms -= slice;
  }
  return !is_cancelled(cancel_flag);
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

char *copy_uri(const std::string &str) noexcept {
  const auto res{reinterpret_cast<char *>(std::malloc(str.length() + 1))};
  if (res) {
    std::memcpy(res, str.c_str(), str.length() + 1);
  }
  return res;
}

tek_tc_err curl_transport(void *, const char *url, long timeout_ms,
                          tek_tc_transport_resp *resp) {
  ttc_curl_ctx curl_ctx;
  if (!curl_ctx.curl) {
    return ttc_err_sub(TEK_TC_ERRC_transport, TEK_TC_ERRC_curle_init);
  }
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_CONNECTTIMEOUT_MS, 16000L);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_USERAGENT, TEK_TC_UA);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_WRITEDATA, &curl_ctx);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_URL, url);
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl_ctx.curl.get(), CURLOPT_WRITEFUNCTION, ttc_curl_write);
  if (const auto curl_res{curl_easy_perform(curl_ctx.curl.get())};
      curl_res != CURLE_OK) {
    if (curl_ctx.too_large) {
      return ttc_err_sub(TEK_TC_ERRC_transport, TEK_TC_ERRC_size_mismatch);
    }
    return {.type = TEK_TC_ERR_TYPE_curle,
            .primary = TEK_TC_ERRC_transport,
            .auxiliary = curl_res,
            .extra = 0,
            .uri = copy_uri(url)};
  }
  long status{};
  curl_easy_getinfo(curl_ctx.curl.get(), CURLINFO_RESPONSE_CODE, &status);
  curl_ctx.curl.reset();
  const auto data{std::malloc(curl_ctx.buf.empty() ? 1 : curl_ctx.buf.size())};
  if (!data) {
    return ttc_err_sub(TEK_TC_ERRC_transport, TEK_TC_ERRC_mem_alloc);
  }
  std::ranges::copy(curl_ctx.buf, reinterpret_cast<char *>(data));
  *resp = {.status = static_cast<int>(status),
           .data = data,
           .size = static_cast<int>(curl_ctx.buf.size())};
  return ttc_err_ok();
}

tek_tc_err fetch_url(const tek_tc_lib_ctx &lib_ctx, const std::string &url,
                     tek_tc_errc prim, unique_buf &body, int &size,
                     const atomic_bool *cancel_flag) {
  auto backoff_ms{lib_ctx.retry_backoff_ms};
  for (int attempt = 0;; ++attempt) {
    if (is_cancelled(cancel_flag)) {
      return ttc_err_sub(prim, TEK_TC_ERRC_cancelled);
    }
    tek_tc_transport_resp resp{};
    auto res{lib_ctx.transport(lib_ctx.transport_data, url.c_str(),
                               lib_ctx.timeout_ms, &resp)};
    unique_buf data{resp.data, std::free};
    if (tek_tc_err_success(&res)) {
      if (resp.status < 200 || resp.status >= 300) {
        return {.type = TEK_TC_ERR_TYPE_http,
                .primary = prim,
                .auxiliary = resp.status,
                .extra = 0,
                .uri = copy_uri(url)};
      }
      if (resp.size < 0 || (resp.size > 0 && !resp.data)) {
        return ttc_err_sub(prim, TEK_TC_ERRC_size_mismatch);
      }
      body = std::move(data);
      size = resp.size;
      return ttc_err_ok();
    }
    // Attribute the failure to the calling operation
    if (res.type == TEK_TC_ERR_TYPE_basic) {
      res = ttc_err_sub(prim, res.primary);
    } else {
      res.primary = prim;
    }
    if (!res.uri) {
      res.uri = copy_uri(url);
    }
    if (attempt >= lib_ctx.max_retries) {
      return res;
    }
    tek_tc_err_release(&res);
    if (!backoff_sleep(backoff_ms, cancel_flag)) {
      return ttc_err_sub(prim, TEK_TC_ERRC_cancelled);
    }
    backoff_ms *= 2;
  }
}

} // namespace tek::tactclient
