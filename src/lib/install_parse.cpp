//===-- install_parse.cpp - install manifest parsing ----------------------===//
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
/// Implementation of @ref tek_tc_im_parse and related functions.
///
/// Install manifest is a big-endian binary file: `IN` magic, version, hash
///    size, tag count, entry count, then tags (name, type and a bitmask over
///    all entries), then entries (path, content key and size). The parser
///    transposes per-tag entry masks into per-entry tag masks, and copies all
///    strings into a single buffer holding the whole parsed manifest.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/content.h"

#include "byte_reader.hpp"
#include "common/error.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace tek::tactclient::content {

namespace {

//===-- Private constants -------------------------------------------------===//

/// Install manifest magic number as it appears in the data.
static constexpr char im_magic[]{'I', 'N'};
/// The only supported install manifest version.
static constexpr std::uint8_t im_version = 1;
/// Supported content key size.
static constexpr std::uint8_t im_hash_size = 16;
/// Minimum size of an entry: empty path terminator, hash and size.
static constexpr std::size_t min_entry_size = 1 + im_hash_size + 4;

//===-- Private types -----------------------------------------------------===//

/// Tag data read in the first pass.
struct tag_desc {
  std::string_view name;
  std::uint16_t type;
  /// Mask of entries that have the tag.
  std::span<const unsigned char> mask;
};

/// Entry data read in the first pass.
struct entry_desc {
  std::string_view path;
  tek_tc_hash ckey;
  std::uint32_t size;
};

//===-- Private functions -------------------------------------------------===//

/// Get number of bytes in a bitmask.
///
/// @param num_bits
///    Number of bits in the mask.
/// @return Size of the mask, in bytes.
constexpr std::size_t mask_size(std::size_t num_bits) noexcept {
  return (num_bits + 7) / 8;
}

/// Check whether a bit is set in an MSB-first bitmask.
constexpr bool test_bit(const unsigned char *_Nonnull mask,
                        std::size_t index) noexcept {
  return mask[index / 8] & (0x80 >> (index % 8));
}

/// Create an install manifest parsing error.
///
/// @param errc
///    Error code describing what's wrong.
/// @return A @ref tek_tc_err for @p errc.
tek_tc_err im_err(tek_tc_errc errc) noexcept {
  return ttc_err_sub(TEK_TC_ERRC_install_parse, errc);
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_im_parse(const void *data, int size,
                           tek_tc_install_manifest *manifest) {
  byte_reader reader{data, static_cast<std::size_t>(size)};
  std::span<const unsigned char> magic;
  std::uint8_t version;
  std::uint8_t hash_size;
  std::uint16_t num_tags;
  std::uint32_t num_entries;
  if (!reader.read_bytes(sizeof im_magic, magic)) {
    return im_err(TEK_TC_ERRC_truncated_input);
  }
  if (std::memcmp(magic.data(), im_magic, sizeof im_magic)) {
    return im_err(TEK_TC_ERRC_magic_mismatch);
  }
  if (!reader.read_be(version)) {
    return im_err(TEK_TC_ERRC_truncated_input);
  }
  if (version != im_version) {
    return im_err(TEK_TC_ERRC_unsupported_version);
  }
  if (!reader.read_be(hash_size) || !reader.read_be(num_tags) ||
      !reader.read_be(num_entries)) {
    return im_err(TEK_TC_ERRC_truncated_input);
  }
  if (hash_size != im_hash_size) {
    return im_err(TEK_TC_ERRC_invalid_data);
  }
  // Reject counts that can't possibly fit into the input before reserving
  //    memory for them
  const auto entry_mask_size{mask_size(num_entries)};
  if (num_entries > reader.remaining() / min_entry_size ||
      num_tags > reader.remaining() / (entry_mask_size + 3)) {
    return im_err(TEK_TC_ERRC_truncated_input);
  }
  // First pass, validate the data and get sizes of all components
  std::vector<tag_desc> tags;
  tags.reserve(num_tags);
  std::size_t strings_size{};
  for (int i = 0; i < num_tags; ++i) {
    auto &tag{tags.emplace_back()};
    if (!reader.read_cstr(tag.name) || !reader.read_be(tag.type) ||
        !reader.read_bytes(entry_mask_size, tag.mask)) {
      return im_err(TEK_TC_ERRC_truncated_input);
    }
    strings_size += tag.name.length() + 1;
  }
  std::vector<entry_desc> entries;
  entries.reserve(num_entries);
  for (std::uint32_t i = 0; i < num_entries; ++i) {
    auto &entry{entries.emplace_back()};
    if (!reader.read_cstr(entry.path) || !reader.read_hash(entry.ckey) ||
        !reader.read_be(entry.size)) {
      return im_err(TEK_TC_ERRC_truncated_input);
    }
    strings_size += entry.path.length() + 1;
  }
  // Allocate the buffer
  const auto tag_mask_size{mask_size(num_tags)};
  const std::size_t buf_size{sizeof(tek_tc_im_entry) * num_entries +
                             sizeof(tek_tc_im_tag) * num_tags +
                             tag_mask_size * num_entries + strings_size};
  if (buf_size > INT_MAX) {
    return im_err(TEK_TC_ERRC_invalid_data);
  }
  const auto buf{std::malloc(buf_size ? buf_size : 1)};
  if (!buf) {
    return im_err(TEK_TC_ERRC_mem_alloc);
  }
  const auto entries_ptr{reinterpret_cast<tek_tc_im_entry *>(buf)};
  const auto tags_ptr{reinterpret_cast<tek_tc_im_tag *>(entries_ptr +
                                                        num_entries)};
  auto next_mask{reinterpret_cast<unsigned char *>(tags_ptr + num_tags)};
  auto next_str{reinterpret_cast<char *>(next_mask +
                                         tag_mask_size * num_entries)};
  std::memset(next_mask, 0, tag_mask_size * num_entries);
  const auto copy_str{[&next_str](std::string_view str) {
    const auto res{next_str};
    std::memcpy(next_str, str.data(), str.length());
    next_str += str.length();
    *next_str++ = '\0';
    return res;
  }};
  // Second pass, write the data
  for (int i = 0; const auto &tag : tags) {
    tags_ptr[i++] = {.name = copy_str(tag.name), .type = tag.type};
  }
  for (std::uint32_t i = 0; const auto &entry : entries) {
    entries_ptr[i] = {.path = copy_str(entry.path),
                      .ckey = entry.ckey,
                      .ekey = {},
                      .has_ekey = false,
                      .size = entry.size,
                      .tags = next_mask};
    for (std::size_t j = 0; j < tags.size(); ++j) {
      if (test_bit(tags[j].mask.data(), i)) {
        next_mask[j / 8] |= 0x80 >> (j % 8);
      }
    }
    next_mask += tag_mask_size;
    ++i;
  }
  *manifest = {.buf = buf,
               .version = version,
               .num_tags = num_tags,
               .num_entries = static_cast<int>(num_entries),
               .tags = num_tags ? tags_ptr : nullptr,
               .entries = num_entries ? entries_ptr : nullptr};
  return ttc_err_ok();
}

bool tek_tc_im_entry_has_tag(const tek_tc_install_manifest *manifest,
                             const tek_tc_im_entry *entry,
                             const char *tag_name) {
  for (int i = 0; i < manifest->num_tags; ++i) {
    if (!std::strcmp(manifest->tags[i].name, tag_name)) {
      return test_bit(entry->tags, i);
    }
  }
  return false;
}

void tek_tc_im_free(tek_tc_install_manifest *manifest) {
  std::free(manifest->buf);
  *manifest = {};
}

} // extern "C"

} // namespace tek::tactclient::content
