//===-- byte_reader.hpp - bounds-checked binary data reader ---------------===//
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
/// Declaration and implementation of @ref tek::tactclient::byte_reader, used
///    by binary format parsers. Every read checks remaining size first, so
///    parsers never touch memory past the input.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/base.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

namespace tek::tactclient {

/// Sequential reader of big-endian binary data.
class byte_reader {
  /// Remaining input data.
  std::span<const unsigned char> data;

public:
  constexpr byte_reader(std::span<const unsigned char> data) noexcept
      : data(data) {}
  byte_reader(const void *_Nonnull data, std::size_t size) noexcept
      : data(reinterpret_cast<const unsigned char *>(data), size) {}

  /// Get the number of bytes that haven't been read yet.
  constexpr std::size_t remaining() const noexcept { return data.size(); }
  /// Get pointer to the next unread byte.
  constexpr const unsigned char *_Nonnull pos() const noexcept {
    return data.data();
  }

  /// Read an unsigned big-endian integer of @p size bytes.
  ///
  /// @param size
  ///    Number of bytes to read, up to 8.
  /// @param [out] value
  ///    Variable that receives the value on success.
  /// @return Value indicating whether there were enough bytes.
  template <typename T>
  constexpr bool read_be(std::size_t size, T &value) noexcept {
    if (data.size() < size) {
      return false;
    }
    std::uint64_t res{};
    for (std::size_t i = 0; i < size; ++i) {
      res = (res << 8) | data[i];
    }
    value = static_cast<T>(res);
    data = data.subspan(size);
    return true;
  }

  /// Read an unsigned big-endian integer of the size of @p T.
  template <typename T> constexpr bool read_be(T &value) noexcept {
    return read_be(sizeof(T), value);
  }

  /// Read a hash.
  bool read_hash(tek_tc_hash &hash) noexcept {
    if (data.size() < sizeof hash.bytes) {
      return false;
    }
    std::memcpy(hash.bytes, data.data(), sizeof hash.bytes);
    data = data.subspan(sizeof hash.bytes);
    return true;
  }

  /// Read a null-terminated string.
  ///
  /// @param [out] str
  ///    Variable that receives view of the string, without terminator.
  /// @return Value indicating whether a terminator has been found.
  bool read_cstr(std::string_view &str) noexcept {
    const std::string_view view(reinterpret_cast<const char *>(data.data()),
                                data.size());
    const auto end{view.find('\0')};
    if (end == std::string_view::npos) {
      return false;
    }
    str = view.substr(0, end);
    data = data.subspan(end + 1);
    return true;
  }

  /// Skip bytes, getting a view of them.
  ///
  /// @param size
  ///    Number of bytes to skip.
  /// @param [out] bytes
  ///    Variable that receives view of skipped bytes.
  /// @return Value indicating whether there were enough bytes.
  constexpr bool read_bytes(std::size_t size,
                            std::span<const unsigned char> &bytes) noexcept {
    if (data.size() < size) {
      return false;
    }
    bytes = data.first(size);
    data = data.subspan(size);
    return true;
  }
};

} // namespace tek::tactclient
