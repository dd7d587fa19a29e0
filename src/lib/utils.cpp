//===-- utils.cpp - utility function implementations ----------------------===//
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
/// Implementation of utility functions declared in utils.h, and public hash
///    functions.
///
//===----------------------------------------------------------------------===//
#include "utils.h"

#include "common/error.h"
#include "os.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/evp.h>

namespace tek::tactclient {

namespace {

/// Lowercase hexadecimal digits.
static constexpr char hex_digits[]{"0123456789abcdef"};
/// Size of the buffer used for hashing files, in bytes.
static constexpr std::size_t file_buf_size = 1024 * 1024;

/// Closes an OS file handle when going out of scope.
struct handle_guard {
  ttci_os_handle handle;

  ~handle_guard() { ttci_os_close_handle(handle); }
};

/// Get the value of a hexadecimal digit.
///
/// @param c
///    Character to convert.
/// @return Value of the digit, or `-1` if @p c is not a hexadecimal digit.
constexpr int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

extern "C" {

bool ttci_u_str_to_hash(const char str[32], tek_tc_hash *hash) {
  for (int i = 0; i < 16; ++i) {
    const int high = hex_value(str[i * 2]);
    const int low = hex_value(str[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    hash->bytes[i] = static_cast<unsigned char>((high << 4) | low);
  }
  return true;
}

void ttci_u_hash_to_str(const tek_tc_hash *hash, char str[32]) {
  for (int i = 0; i < 16; ++i) {
    str[i * 2] = hex_digits[hash->bytes[i] >> 4];
    str[i * 2 + 1] = hex_digits[hash->bytes[i] & 0xF];
  }
}

bool ttci_u_md5(const void *data, int size, tek_tc_hash *hash) {
  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
      EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  return EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) &&
         EVP_DigestUpdate(ctx.get(), data, size) &&
         EVP_DigestFinal_ex(ctx.get(), hash->bytes, nullptr);
}

tek_tc_err ttci_u_md5_file(const char *path, tek_tc_errc prim,
                           tek_tc_hash *hash) {
  const auto handle{ttci_os_file_open(path)};
  if (handle == TTCI_OS_INVALID_HANDLE) {
    return ttci_os_io_err(path, prim, ttci_os_get_last_error(),
                          TEK_TC_ERR_IO_TYPE_open);
  }
  const handle_guard guard{handle};
  auto remaining{ttci_os_file_get_size(handle)};
  if (remaining == SIZE_MAX) {
    return ttci_os_io_err(path, prim, ttci_os_get_last_error(),
                          TEK_TC_ERR_IO_TYPE_get_size);
  }
  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
      EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr)) {
    return ttc_err_sub(prim, TEK_TC_ERRC_md5);
  }
  const auto buf{std::make_unique_for_overwrite<unsigned char[]>(
      std::min(remaining, file_buf_size))};
  while (remaining) {
    const auto chunk{std::min(remaining, file_buf_size)};
    if (!ttci_os_file_read(handle, buf.get(), chunk)) {
      return ttci_os_io_err(path, prim, ttci_os_get_last_error(),
                            TEK_TC_ERR_IO_TYPE_read);
    }
    if (!EVP_DigestUpdate(ctx.get(), buf.get(), chunk)) {
      return ttc_err_sub(prim, TEK_TC_ERRC_md5);
    }
    remaining -= chunk;
  }
  if (!EVP_DigestFinal_ex(ctx.get(), hash->bytes, nullptr)) {
    return ttc_err_sub(prim, TEK_TC_ERRC_md5);
  }
  return ttc_err_ok();
}

//===-- Public functions --------------------------------------------------===//

tek_tc_err tek_tc_hash_parse(const char *str, int len, tek_tc_hash *hash) {
  if (len != 32) {
    return ttc_err_basic(TEK_TC_ERRC_hash_parse);
  }
  tek_tc_hash res;
  if (!ttci_u_str_to_hash(str, &res)) {
    return ttc_err_basic(TEK_TC_ERRC_hash_parse);
  }
  *hash = res;
  return ttc_err_ok();
}

void tek_tc_hash_to_str(const tek_tc_hash *hash, char str[33]) {
  ttci_u_hash_to_str(hash, str);
  str[32] = '\0';
}

} // extern "C"

} // namespace tek::tactclient
