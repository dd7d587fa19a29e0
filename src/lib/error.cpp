//===-- error.cpp - error message functions -------------------------------===//
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
/// Implementation of @ref tek_tc_err_get_msgs, @ref tek_tc_err_release_msgs
///    and @ref tek_tc_err_release.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/error.h"

#include "config.h" // IWYU pragma: keep
#include "os.h"

#include <cstdio>
#include <cstdlib>
#include <curl/curl.h>
#ifdef TEK_TCB_GETTEXT
#include <libintl.h>
#endif // def TEK_TCB_GETTEXT

namespace tek::tactclient {

namespace {

#ifdef TEK_TCB_GETTEXT

[[gnu::returns_nonnull, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
inline const char *_Nonnull ttc_gettext(const char *_Nonnull msg) {
  return dgettext("tek-tactclient", msg);
}

#else // def TEK_TCB_GETTEXT

#define ttc_gettext(msg) msg

#endif // def TEK_TCB_GETTEXT else

//===-- Private functions -------------------------------------------------===//

/// Get message for an error code.
///
/// @param errc
///    Error code to get message for.
/// @return Human-readable message for @p errc.
[[gnu::returns_nonnull]]
const char *_Nonnull get_errc_msg(int errc) {
  switch (static_cast<tek_tc_errc>(errc)) {
  case TEK_TC_ERRC_ok:
    return ttc_gettext("Operation completed successfully");
  case TEK_TC_ERRC_all_failed:
    return ttc_gettext("Every item of the batch has failed");
  case TEK_TC_ERRC_blte_decode:
    return ttc_gettext("Failed to decode a BLTE container");
  case TEK_TC_ERRC_build_config:
    return ttc_gettext("Failed to parse build configuration");
  case TEK_TC_ERRC_cancelled:
    return ttc_gettext("The operation has been cancelled");
  case TEK_TC_ERRC_checksum_mismatch:
    return ttc_gettext("MD5 checksum mismatch");
  case TEK_TC_ERRC_cmap_corrupt:
    return ttc_gettext(
        "CKey map file is corrupted, an empty map is used instead");
  case TEK_TC_ERRC_cmap_load:
    return ttc_gettext("Failed to load CKey map");
  case TEK_TC_ERRC_cmap_save:
    return ttc_gettext("Failed to save CKey map");
  case TEK_TC_ERRC_content_mismatch:
    return ttc_gettext("Decoded content does not match its content key");
  case TEK_TC_ERRC_curle_init:
    return ttc_gettext("curl_easy_init() failed");
  case TEK_TC_ERRC_ekey_not_found:
    return ttc_gettext("Content key is not present in the encoding manifest");
  case TEK_TC_ERRC_encoding_parse:
    return ttc_gettext("Failed to parse encoding manifest");
  case TEK_TC_ERRC_encrypted_unsupported:
    return ttc_gettext("Content is encrypted, decryption is not supported");
  case TEK_TC_ERRC_fetch_cdns:
    return ttc_gettext("Failed to fetch CDN table");
  case TEK_TC_ERRC_fetch_config:
    return ttc_gettext("Failed to fetch build configuration from CDN");
  case TEK_TC_ERRC_fetch_data:
    return ttc_gettext("Failed to fetch data from CDN");
  case TEK_TC_ERRC_fetch_encoding:
    return ttc_gettext("Failed to fetch encoding manifest");
  case TEK_TC_ERRC_fetch_install:
    return ttc_gettext("Failed to fetch install manifest");
  case TEK_TC_ERRC_fetch_versions:
    return ttc_gettext("Failed to fetch version table");
  case TEK_TC_ERRC_hash_parse:
    return ttc_gettext("Invalid hexadecimal hash string");
  case TEK_TC_ERRC_index_build:
    return ttc_gettext("Failed to build CKey map from directory contents");
  case TEK_TC_ERRC_install_parse:
    return ttc_gettext("Failed to parse install manifest");
  case TEK_TC_ERRC_invalid_data:
    return ttc_gettext("Encountered invalid data");
  case TEK_TC_ERRC_invalid_pattern:
    return ttc_gettext("Invalid file name pattern");
  case TEK_TC_ERRC_json_parse:
    return ttc_gettext("JSON parsing error");
  case TEK_TC_ERRC_magic_mismatch:
    return ttc_gettext("Magic number mismatch (data corruption)");
  case TEK_TC_ERRC_malformed_response:
    return ttc_gettext("Server response is missing expected fields");
  case TEK_TC_ERRC_md5:
    return ttc_gettext("MD5 hashing error");
  case TEK_TC_ERRC_mem_alloc:
    return ttc_gettext("Memory allocation error");
  case TEK_TC_ERRC_no_matching_region:
    return ttc_gettext("The table has no record for requested region");
  case TEK_TC_ERRC_recursion_limit:
    return ttc_gettext("BLTE container nesting is too deep");
  case TEK_TC_ERRC_size_mismatch:
    return ttc_gettext("Decoded data size does not match the declared one");
  case TEK_TC_ERRC_transport:
    return ttc_gettext("Transport error");
  case TEK_TC_ERRC_truncated_input:
    return ttc_gettext("Input ends before a field that it declares");
  case TEK_TC_ERRC_unknown_mode:
    return ttc_gettext("Unknown BLTE chunk encoding mode");
  case TEK_TC_ERRC_unknown_product:
    return ttc_gettext("Unknown product name");
  case TEK_TC_ERRC_unsupported_version:
    return ttc_gettext("Unsupported format version");
  case TEK_TC_ERRC_write_failed:
    return ttc_gettext("Failed to write a file");
  case TEK_TC_ERRC_wt_start:
    return ttc_gettext("Failed to start a worker thread");
  case TEK_TC_ERRC_zlib:
    return ttc_gettext("zlib decompression error");
  default:
    return ttc_gettext("Unknown error code");
  }
}

/// Get message for an I/O operation type.
[[gnu::returns_nonnull]]
const char *_Nonnull get_io_type_msg(int io_type) {
  switch (static_cast<tek_tc_err_io_type>(io_type)) {
  case TEK_TC_ERR_IO_TYPE_none:
    return ttc_gettext("Not an I/O operation");
  case TEK_TC_ERR_IO_TYPE_check_existence:
    return ttc_gettext("Checking for existence");
  case TEK_TC_ERR_IO_TYPE_open:
    return ttc_gettext("Opening/creating");
  case TEK_TC_ERR_IO_TYPE_get_size:
    return ttc_gettext("Getting size");
  case TEK_TC_ERR_IO_TYPE_read:
    return ttc_gettext("Reading");
  case TEK_TC_ERR_IO_TYPE_write:
    return ttc_gettext("Writing");
  case TEK_TC_ERR_IO_TYPE_move:
    return ttc_gettext("Moving");
  case TEK_TC_ERR_IO_TYPE_delete:
    return ttc_gettext("Deleting");
  case TEK_TC_ERR_IO_TYPE_read_dir:
    return ttc_gettext("Reading directory entries");
  default:
    return ttc_gettext("Unknown I/O operation");
  }
}

/// Format a message with a single integer value into a heap-allocated
///    string.
///
/// @param [in] fmt
///    printf format string with a single `%d` specifier.
/// @param value
///    Value to substitute.
/// @return Pointer to the formatted string, or `nullptr` if allocation
///    fails. It must be freed with `free` after use.
[[gnu::nonnull(1), gnu::format(printf, 1, 0)]]
char *_Nullable format_int(const char *_Nonnull fmt, int value) {
  const int len{std::snprintf(nullptr, 0, fmt, value)};
  if (len < 0) {
    return nullptr;
  }
  const auto buf{reinterpret_cast<char *>(std::malloc(len + 1))};
  if (buf) {
    std::snprintf(buf, len + 1, fmt, value);
  }
  return buf;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err_msgs tek_tc_err_get_msgs(const tek_tc_err *err) {
  tek_tc_err_msgs msgs{};
  msgs.type = err->type;
  msgs.primary = get_errc_msg(err->primary);
  switch (err->type) {
  case TEK_TC_ERR_TYPE_basic:
    msgs.type_str = ttc_gettext("Basic");
    break;
  case TEK_TC_ERR_TYPE_sub:
    msgs.type_str = ttc_gettext("Compound");
    msgs.auxiliary = get_errc_msg(err->auxiliary);
    if (err->primary == TEK_TC_ERRC_blte_decode) {
      msgs.extra = format_int(ttc_gettext("Chunk index: %d"), err->extra);
    } else if (err->auxiliary == TEK_TC_ERRC_checksum_mismatch) {
      msgs.extra = format_int(ttc_gettext("Page index: %d"), err->extra);
    }
    break;
  case TEK_TC_ERR_TYPE_os:
    msgs.type_str = ttc_gettext("OS");
    msgs.auxiliary = ttci_os_get_err_msg(err->auxiliary);
    msgs.extra = get_io_type_msg(err->extra);
    msgs.uri_type = ttc_gettext("Path");
    break;
  case TEK_TC_ERR_TYPE_curle:
    msgs.type_str = ttc_gettext("libcurl-easy");
    msgs.auxiliary = curl_easy_strerror(static_cast<CURLcode>(err->auxiliary));
    msgs.uri_type = ttc_gettext("URL");
    break;
  case TEK_TC_ERR_TYPE_http:
    msgs.type_str = ttc_gettext("HTTP");
    msgs.auxiliary =
        format_int(ttc_gettext("Server responded with status %d"),
                   err->auxiliary);
    msgs.uri_type = ttc_gettext("URL");
    break;
  default:
    msgs.type_str = ttc_gettext("Unknown");
  }
  return msgs;
}

void tek_tc_err_release_msgs(tek_tc_err_msgs *err_msgs) {
  switch (err_msgs->type) {
  case TEK_TC_ERR_TYPE_sub:
    std::free(const_cast<char *>(err_msgs->extra));
    break;
  case TEK_TC_ERR_TYPE_os:
  case TEK_TC_ERR_TYPE_http:
    std::free(const_cast<char *>(err_msgs->auxiliary));
    break;
  default:
    break;
  }
  *err_msgs = {};
}

void tek_tc_err_release(tek_tc_err *err) {
  std::free(const_cast<char *>(err->uri));
  err->uri = nullptr;
}

} // extern "C"

} // namespace tek::tactclient
