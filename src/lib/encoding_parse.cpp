//===-- encoding_parse.cpp - encoding manifest parsing --------------------===//
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
/// Implementation of @ref tek_tc_enc_parse and related functions.
///
/// Only the content key -> encoding key part of the manifest is used. It
///    consists of a page index (first key and MD5 of each page) followed by
///    fixed-size pages of variable-length entries. Lookups binary search the
///    index and then scan a single page.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/content.h"

#include "byte_reader.hpp"
#include "common/error.h"
#include "content_ops.hpp"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <span>

namespace tek::tactclient::content {

namespace {

//===-- Private constants -------------------------------------------------===//

/// Encoding manifest magic number as it appears in the data.
static constexpr char enc_magic[]{'E', 'N'};
/// The only supported encoding manifest version.
static constexpr std::uint8_t enc_version = 1;
/// Size of a page index entry: first key and page MD5.
static constexpr std::size_t index_entry_size = 16 + 16;
/// Size of the fixed part of a page entry: key count, file size and content
///    key.
static constexpr std::size_t page_entry_hdr_size = 1 + 5 + 16;

//===-- Private functions -------------------------------------------------===//

/// Create an encoding manifest parsing error.
tek_tc_err enc_err(tek_tc_errc errc) noexcept {
  return ttc_err_sub(TEK_TC_ERRC_encoding_parse, errc);
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_enc_parse(void *data, int size, tek_tc_encoding *enc) {
  byte_reader reader{data, static_cast<std::size_t>(size)};
  std::span<const unsigned char> magic;
  std::uint8_t version;
  std::uint8_t ckey_size;
  std::uint8_t ekey_size;
  std::uint16_t ce_page_kb;
  std::uint16_t espec_page_kb;
  std::uint32_t ce_page_count;
  std::uint32_t espec_page_count;
  std::uint8_t unknown;
  std::uint32_t espec_size;
  if (!reader.read_bytes(sizeof enc_magic, magic)) {
    return enc_err(TEK_TC_ERRC_truncated_input);
  }
  if (std::memcmp(magic.data(), enc_magic, sizeof enc_magic)) {
    return enc_err(TEK_TC_ERRC_magic_mismatch);
  }
  if (!reader.read_be(version)) {
    return enc_err(TEK_TC_ERRC_truncated_input);
  }
  if (version != enc_version) {
    return enc_err(TEK_TC_ERRC_unsupported_version);
  }
  if (!reader.read_be(ckey_size) || !reader.read_be(ekey_size) ||
      !reader.read_be(ce_page_kb) || !reader.read_be(espec_page_kb) ||
      !reader.read_be(ce_page_count) || !reader.read_be(espec_page_count) ||
      !reader.read_be(unknown) || !reader.read_be(espec_size)) {
    return enc_err(TEK_TC_ERRC_truncated_input);
  }
  if (ckey_size != sizeof(tek_tc_hash) || ekey_size != sizeof(tek_tc_hash) ||
      !ce_page_kb) {
    return enc_err(TEK_TC_ERRC_invalid_data);
  }
  std::span<const unsigned char> espec;
  std::span<const unsigned char> index;
  std::span<const unsigned char> pages;
  const std::size_t page_size{static_cast<std::size_t>(ce_page_kb) * 1024};
  if (!reader.read_bytes(espec_size, espec) ||
      ce_page_count > reader.remaining() / index_entry_size ||
      !reader.read_bytes(ce_page_count * index_entry_size, index) ||
      ce_page_count > reader.remaining() / page_size ||
      !reader.read_bytes(ce_page_count * page_size, pages)) {
    return enc_err(TEK_TC_ERRC_truncated_input);
  }
  // Verify pages
  for (std::uint32_t i = 0; i < ce_page_count; ++i) {
    tek_tc_hash md5;
    if (!ttci_u_md5(&pages[i * page_size], page_size, &md5)) {
      return enc_err(TEK_TC_ERRC_md5);
    }
    if (!bytes_eq(&index[i * index_entry_size + 16], md5)) {
      auto err{enc_err(TEK_TC_ERRC_checksum_mismatch)};
      err.extra = static_cast<int>(i);
      return err;
    }
  }
  *enc = {.buf = data,
          .size = size,
          .num_pages = static_cast<int>(ce_page_count),
          .page_size = static_cast<int>(page_size),
          .page_index = index.data(),
          .pages = pages.data()};
  return ttc_err_ok();
}

bool tek_tc_enc_find(const tek_tc_encoding *enc, const tek_tc_hash *ckey,
                     tek_tc_hash *ekey) {
  if (!enc->num_pages) {
    return false;
  }
  // Find the last page with first key not greater than ckey
  int low{};
  int high{enc->num_pages};
  while (high - low > 1) {
    const int mid{low + (high - low) / 2};
    if (std::memcmp(&enc->page_index[mid * index_entry_size], ckey->bytes,
                    sizeof ckey->bytes) <= 0) {
      low = mid;
    } else {
      high = mid;
    }
  }
  byte_reader reader{&enc->pages[static_cast<std::size_t>(low) *
                                 enc->page_size],
                     static_cast<std::size_t>(enc->page_size)};
  while (reader.remaining() >= page_entry_hdr_size) {
    std::uint8_t key_count;
    std::uint64_t file_size;
    tek_tc_hash entry_ckey;
    reader.read_be(key_count);
    if (!key_count) {
      // Zero padding at the end of the page
      break;
    }
    reader.read_be(5, file_size);
    reader.read_hash(entry_ckey);
    std::span<const unsigned char> ekeys;
    if (!reader.read_bytes(key_count * sizeof(tek_tc_hash), ekeys)) {
      break;
    }
    if (entry_ckey == *ckey) {
      std::memcpy(ekey->bytes, ekeys.data(), sizeof ekey->bytes);
      return true;
    }
  }
  return false;
}

void tek_tc_enc_free(tek_tc_encoding *enc) {
  std::free(enc->buf);
  *enc = {};
}

} // extern "C"

} // namespace tek::tactclient::content
