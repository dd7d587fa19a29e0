//===-- utils.h - utility function declarations ---------------------------===//
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
/// Declarations of small utility functions that may be used anywhere in the
///    project.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/base.h" // IWYU pragma: keep

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Convert a 32-character hexadecimal string into a hash.
///
/// @param [in] str
///    Pointer to the string to convert, both lowercase and uppercase digits
///    are accepted.
/// @param [out] hash
///    Pointer to the hash that receives converted bytes.
/// @return Value indicating whether all characters were valid hexadecimal
///    digits.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
bool ttci_u_str_to_hash(const char str[_Nonnull 32],
                        tek_tc_hash *_Nonnull hash);

/// Convert a hash to a string.
///
/// @param [in] hash
///    Pointer to the hash to convert.
/// @param [out] str
///    Pointer to the buffer that receives the resulting lowercase string
///    (without terminating null character).
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
void ttci_u_hash_to_str(const tek_tc_hash *_Nonnull hash,
                        char str[_Nonnull 32]);

/// Compute MD5 hash of data.
///
/// @param [in] data
///    Pointer to the data to hash.
/// @param size
///    Number of bytes to read from @p data.
/// @param [out] hash
///    Pointer to the hash that receives the digest.
/// @return Value indicating whether hashing succeeded.
[[gnu::visibility("internal"), gnu::nonnull(3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
bool ttci_u_md5(const void *_Nullable data, int size,
                tek_tc_hash *_Nonnull hash);

/// Compute MD5 hash of a file's contents.
///
/// @param [in] path
///    Path to the file, as a null-terminated string.
/// @param prim
///    Primary error code for returned errors.
/// @param [out] hash
///    Pointer to the hash that receives the digest.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::visibility("internal"), gnu::nonnull(1, 3), gnu::access(read_only, 1),
  gnu::access(write_only, 3), gnu::null_terminated_string_arg(1)]]
tek_tc_err ttci_u_md5_file(const char *_Nonnull path, tek_tc_errc prim,
                           tek_tc_hash *_Nonnull hash);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
