//===-- blte.cpp - BLTE container decoding --------------------------------===//
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
/// Implementation of @ref tek_tc_blte_decode.
///
/// BLTE container starts with `BLTE` magic and big-endian header size. Zero
///    header size means that the rest of the container is a single chunk
///    without a checksum. Otherwise the header continues with flags byte,
///    24-bit chunk count and a table of `{compressed size, decompressed size,
///    MD5}` entries, and chunk data starts right after the header. Every
///    chunk begins with its encoding mode byte, which is covered by the MD5.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/content.h"

#include "byte_reader.hpp"
#include "common/error.h"
#include "content_ops.hpp"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"
#include "utils.h"
#include "zlib_api.h"

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <span>
#include <vector>

namespace tek::tactclient::blte {

namespace {

//===-- Private constants -------------------------------------------------===//

/// BLTE magic number as it appears in the data.
static constexpr unsigned char magic[]{'B', 'L', 'T', 'E'};
/// Size of the fixed header part, including magic and header size fields.
static constexpr std::size_t base_hdr_size = 8;
/// Size of the chunk table header (flags and chunk count).
static constexpr std::size_t table_hdr_size = 4;
/// Size of a chunk table entry.
static constexpr std::size_t chunk_entry_size = 24;
/// The only known chunk table flags value.
static constexpr std::uint8_t table_flags = 0x0F;
/// Maximum nesting level of containers in @ref TEK_TC_BLTE_MODE_frame and
///    @ref TEK_TC_BLTE_MODE_recursive chunks.
static constexpr int max_depth = 1;

//===-- Private types -----------------------------------------------------===//

/// Chunk table entry.
struct chunk_info {
  /// Declared size of decoded chunk data.
  std::uint32_t decomp_size;
  /// MD5 hash of chunk data.
  tek_tc_hash md5;
  /// Chunk data, including the mode byte.
  std::span<const unsigned char> data;
};

/// Parsed container structure.
struct container {
  /// Value indicating whether the container has a chunk table.
  bool has_table;
  /// Chunk entries. For containers without table, has a single entry with
  ///    unset `decomp_size` and `md5`.
  std::vector<chunk_info> chunks;
  /// Sum of declared decoded chunk sizes.
  std::size_t total_size;
};

//===-- Private functions -------------------------------------------------===//

/// Parse container header and chunk table.
///
/// @param data
///    Container data.
/// @param [out] cont
///    Variable that receives parsed structure.
/// @return A @ref tek_tc_err indicating the result of operation.
static tek_tc_err parse_container(std::span<const unsigned char> data,
                                  container &cont) {
  byte_reader reader{data};
  std::span<const unsigned char> magic_bytes;
  if (!reader.read_bytes(sizeof magic, magic_bytes)) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_truncated_input);
  }
  if (std::memcmp(magic_bytes.data(), magic, sizeof magic)) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_magic_mismatch);
  }
  std::uint32_t hdr_size;
  if (!reader.read_be(hdr_size)) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_truncated_input);
  }
  if (!hdr_size) {
    if (!reader.remaining()) {
      return ttc_err_chunk(TEK_TC_ERRC_truncated_input, 0);
    }
    cont.has_table = false;
    cont.chunks.push_back(
        {.decomp_size = 0, .md5 = {}, .data = data.subspan(base_hdr_size)});
    cont.total_size = 0;
    return ttc_err_ok();
  }
  if (hdr_size > data.size()) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_truncated_input);
  }
  std::uint8_t flags;
  std::uint32_t num_chunks;
  if (!reader.read_be(flags) || !reader.read_be(3, num_chunks)) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_truncated_input);
  }
  if (flags != table_flags) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode,
                       TEK_TC_ERRC_unsupported_version);
  }
  if (!num_chunks || hdr_size != base_hdr_size + table_hdr_size +
                                     num_chunks * chunk_entry_size) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_invalid_data);
  }
  cont.has_table = true;
  cont.chunks.reserve(num_chunks);
  cont.total_size = 0;
  byte_reader data_reader{data.subspan(hdr_size)};
  for (std::uint32_t i = 0; i < num_chunks; ++i) {
    std::uint32_t comp_size;
    chunk_info chunk;
    // Header size has been validated to fit the whole table
    reader.read_be(comp_size);
    reader.read_be(chunk.decomp_size);
    reader.read_hash(chunk.md5);
    if (!comp_size) {
      return ttc_err_chunk(TEK_TC_ERRC_invalid_data, i);
    }
    if (!data_reader.read_bytes(comp_size, chunk.data)) {
      return ttc_err_chunk(TEK_TC_ERRC_truncated_input, i);
    }
    cont.total_size += chunk.decomp_size;
    cont.chunks.push_back(chunk);
  }
  if (cont.total_size > INT_MAX) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_size_mismatch);
  }
  return ttc_err_ok();
}

/// Inflate zlib stream into a buffer of exact expected size.
///
/// @param in
///    zlib stream data.
/// @param out
///    Buffer that receives inflated data.
/// @return Value indicating whether the stream is valid and has inflated to
///    exactly `out.size()` bytes.
static bool inflate_exact(std::span<const unsigned char> in,
                          std::span<unsigned char> out) {
  ttci_z_stream strm{};
  if (ttci_z_inflateInit(&strm) != Z_OK) {
    return false;
  }
  unsigned char dummy;
  strm.next_in = const_cast<unsigned char *>(in.data());
  strm.avail_in = in.size();
  strm.next_out = out.empty() ? &dummy : out.data();
  strm.avail_out = out.size();
  int res;
  do {
    res = ttci_z_inflate(&strm, Z_FINISH);
  } while (res == Z_OK);
  const bool success{res == Z_STREAM_END && !strm.avail_out};
  ttci_z_inflateEnd(&strm);
  return success;
}

/// Inflate zlib stream of unknown decompressed size.
///
/// @param in
///    zlib stream data.
/// @param [out] out
///    Vector that receives inflated data.
/// @return Value indicating whether the stream is valid and complete.
static bool inflate_dynamic(std::span<const unsigned char> in,
                            std::vector<unsigned char> &out) {
  ttci_z_stream strm{};
  if (ttci_z_inflateInit(&strm) != Z_OK) {
    return false;
  }
  strm.next_in = const_cast<unsigned char *>(in.data());
  strm.avail_in = in.size();
  int res;
  do {
    const auto prev_size{out.size()};
    if (prev_size >= INT_MAX) {
      res = Z_MEM_ERROR;
      break;
    }
    out.resize(prev_size + std::max<std::size_t>(in.size() * 2, 0x10000));
    strm.next_out = &out[prev_size];
    strm.avail_out = out.size() - prev_size;
    res = ttci_z_inflate(&strm, Z_NO_FLUSH);
    out.resize(out.size() - strm.avail_out);
  } while (res == Z_OK);
  ttci_z_inflateEnd(&strm);
  return res == Z_STREAM_END;
}

static tek_tc_err decode_into(std::span<const unsigned char> data, int depth,
                              std::span<unsigned char> out);

/// Decode a chunk into a buffer of its declared decoded size.
///
/// @param chunk
///    Chunk data, including the mode byte.
/// @param index
///    Index of the chunk in its container.
/// @param depth
///    Nesting level of the container that the chunk belongs to.
/// @param out
///    Buffer that receives decoded data.
/// @return A @ref tek_tc_err indicating the result of operation.
static tek_tc_err decode_chunk(std::span<const unsigned char> chunk,
                               int index, int depth,
                               std::span<unsigned char> out) {
  const auto payload{chunk.subspan(1)};
  switch (chunk[0]) {
  case TEK_TC_BLTE_MODE_none:
    if (payload.size() != out.size()) {
      return ttc_err_chunk(TEK_TC_ERRC_size_mismatch, index);
    }
    if (!payload.empty()) {
      std::memcpy(out.data(), payload.data(), payload.size());
    }
    return ttc_err_ok();
  case TEK_TC_BLTE_MODE_zlib:
    return inflate_exact(payload, out)
               ? ttc_err_ok()
               : ttc_err_chunk(TEK_TC_ERRC_zlib, index);
  case TEK_TC_BLTE_MODE_frame:
  case TEK_TC_BLTE_MODE_recursive: {
    if (depth >= max_depth) {
      return ttc_err_chunk(TEK_TC_ERRC_recursion_limit, index);
    }
    auto res{decode_into(payload, depth + 1, out)};
    if (!tek_tc_err_success(&res)) {
      // Report the position in the outermost container
      res.extra = index;
    }
    return res;
  }
  case TEK_TC_BLTE_MODE_encrypted:
    return ttc_err_chunk(TEK_TC_ERRC_encrypted_unsupported, index);
  default:
    return ttc_err_chunk(TEK_TC_ERRC_unknown_mode, index);
  }
}

/// Verify chunk checksum and decode it.
///
/// @param chunk
///    Chunk table entry.
/// @param index
///    Index of the chunk in its container.
/// @param depth
///    Nesting level of the container that the chunk belongs to.
/// @param out
///    Buffer that receives decoded data.
/// @return A @ref tek_tc_err indicating the result of operation.
static tek_tc_err verify_and_decode(const chunk_info &chunk, int index,
                                    int depth, std::span<unsigned char> out) {
  tek_tc_hash md5;
  if (!ttci_u_md5(chunk.data.data(), chunk.data.size(), &md5)) {
    return ttc_err_chunk(TEK_TC_ERRC_md5, index);
  }
  if (!(md5 == chunk.md5)) {
    return ttc_err_chunk(TEK_TC_ERRC_checksum_mismatch, index);
  }
  return decode_chunk(chunk.data, index, depth, out);
}

/// Decode a container into a buffer of known decoded size.
///
/// @param data
///    Container data.
/// @param depth
///    Nesting level of the container.
/// @param out
///    Buffer that receives decoded data.
/// @return A @ref tek_tc_err indicating the result of operation.
static tek_tc_err decode_into(std::span<const unsigned char> data, int depth,
                              std::span<unsigned char> out) {
  container cont;
  if (auto res{parse_container(data, cont)}; !tek_tc_err_success(&res)) {
    return res;
  }
  if (!cont.has_table) {
    return decode_chunk(cont.chunks.front().data, 0, depth, out);
  }
  if (cont.total_size != out.size()) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_size_mismatch);
  }
  std::size_t offset{};
  for (int i = 0; const auto &chunk : cont.chunks) {
    if (auto res{verify_and_decode(chunk, i++, depth,
                                   out.subspan(offset, chunk.decomp_size))};
        !tek_tc_err_success(&res)) {
      return res;
    }
    offset += chunk.decomp_size;
  }
  return ttc_err_ok();
}

/// Decode a container without chunk table, whose decoded size is not known
///    in advance.
///
/// @param chunk
///    The only chunk of the container, including the mode byte.
/// @param depth
///    Nesting level of the container.
/// @param [out] out
///    Vector that receives decoded data.
/// @return A @ref tek_tc_err indicating the result of operation.
static tek_tc_err decode_unsized(std::span<const unsigned char> chunk,
                                 int depth, std::vector<unsigned char> &out) {
  const auto payload{chunk.subspan(1)};
  switch (chunk[0]) {
  case TEK_TC_BLTE_MODE_none:
    out.assign(payload.begin(), payload.end());
    return ttc_err_ok();
  case TEK_TC_BLTE_MODE_zlib:
    return inflate_dynamic(payload, out) ? ttc_err_ok()
                                         : ttc_err_chunk(TEK_TC_ERRC_zlib, 0);
  case TEK_TC_BLTE_MODE_frame:
  case TEK_TC_BLTE_MODE_recursive: {
    if (depth >= max_depth) {
      return ttc_err_chunk(TEK_TC_ERRC_recursion_limit, 0);
    }
    container cont;
    if (auto res{parse_container(payload, cont)}; !tek_tc_err_success(&res)) {
      res.extra = 0;
      return res;
    }
    if (!cont.has_table) {
      auto res{decode_unsized(cont.chunks.front().data, depth + 1, out)};
      res.extra = 0;
      return res;
    }
    out.resize(cont.total_size);
    auto res{decode_into(payload, depth + 1, out)};
    res.extra = 0;
    return res;
  }
  case TEK_TC_BLTE_MODE_encrypted:
    return ttc_err_chunk(TEK_TC_ERRC_encrypted_unsupported, 0);
  default:
    return ttc_err_chunk(TEK_TC_ERRC_unknown_mode, 0);
  }
}

} // namespace

//===-- Public function ---------------------------------------------------===//

extern "C" tek_tc_err tek_tc_blte_decode(const void *data, int size,
                                         void **out, int *out_size) {
  if (size < 0) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_size_mismatch);
  }
  const std::span input{reinterpret_cast<const unsigned char *>(data),
                        static_cast<std::size_t>(size)};
  container cont;
  if (auto res{parse_container(input, cont)}; !tek_tc_err_success(&res)) {
    return res;
  }
  if (!cont.has_table) {
    std::vector<unsigned char> buf;
    if (auto res{decode_unsized(cont.chunks.front().data, 0, buf)};
        !tek_tc_err_success(&res)) {
      return res;
    }
    if (buf.size() > INT_MAX) {
      return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_size_mismatch);
    }
    // Allocate at least one byte so that empty output is still a valid
    //    pointer
    const auto res_buf{
        reinterpret_cast<unsigned char *>(std::malloc(buf.size() + 1))};
    if (!res_buf) {
      return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_mem_alloc);
    }
    if (!buf.empty()) {
      std::memcpy(res_buf, buf.data(), buf.size());
    }
    *out = res_buf;
    *out_size = static_cast<int>(buf.size());
    return ttc_err_ok();
  }
  const auto res_buf{
      reinterpret_cast<unsigned char *>(std::malloc(cont.total_size + 1))};
  if (!res_buf) {
    return ttc_err_sub(TEK_TC_ERRC_blte_decode, TEK_TC_ERRC_mem_alloc);
  }
  std::size_t offset{};
  for (int i = 0; const auto &chunk : cont.chunks) {
    if (auto res{verify_and_decode(
            chunk, i++, 0,
            std::span{res_buf + offset, chunk.decomp_size})};
        !tek_tc_err_success(&res)) {
      std::free(res_buf);
      return res;
    }
    offset += chunk.decomp_size;
  }
  *out = res_buf;
  *out_size = static_cast<int>(cont.total_size);
  return ttc_err_ok();
}

} // namespace tek::tactclient::blte
