//===-- os.h - OS-specific code -------------------------------------------===//
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
/// Declarations of functions that are implemented differently on different
///    operating systems. Implementations are provided by corresponding os_*.c.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/error.h"

#include <stddef.h>
#include <stdint.h>

//===-- OS-specific declarations ------------------------------------------===//

/// @def TTCL_OS_PATH_SEP_CHAR_STR
/// Path separator character for current operating system as a string literal.
#define TTCL_OS_PATH_SEP_CHAR_STR "/"

/// OS error code type.
typedef int ttcl_os_errc;

//===-- Functions ---------------------------------------------------------===//

/// Create a @ref tek_tc_err for a failed I/O operation on a path.
///
/// @param [in] path
///    Path that was subject to the failed operation, as a null-terminated
///    string. It's copied into the error's `uri`.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref tek_tc_err describing the I/O error.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
tek_tc_err ttcl_os_io_err(const char *_Nonnull path, tek_tc_errc prim,
                          ttcl_os_errc errc, tek_tc_err_io_type io_type);

//===-- General functions -------------------------------------------------===//

/// Get the last error code set by a system call.
///
/// @return OS-specific error code.
[[gnu::visibility("internal")]]
ttcl_os_errc ttcl_os_get_last_error(void);

/// Get the number of milliseconds passed since some point in the past, where
///    the point is guaranteed to be consistent during program runtime.
///
/// @return Number of milliseconds passed since some point in the past.
[[gnu::visibility("internal")]]
uint64_t ttcl_os_get_ticks(void);

/// Register a handler for SIGINT and SIGTERM signals.
///
/// @param handler
///    Signal handler function to register.
[[gnu::visibility("internal"), gnu::nonnull(1)]]
void ttcl_os_reg_sig_handler(void (*_Nonnull handler)(void));

/// Unregister current handler for SIGINT and SIGTERM signals.
[[gnu::visibility("internal")]]
void ttcl_os_unreg_sig_handler(void);

//===-- I/O functions -----------------------------------------------------===//

/// Read the whole contents of a file.
///
/// @param [in] path
///    Path to the file to read, as a null-terminated string.
/// @param prim
///    Primary error code for returned errors.
/// @param [out] size
///    Address of variable that receives size of the file on success.
/// @param [out] err
///    Address of variable that receives the error on failure.
/// @return Pointer to the heap-allocated buffer containing file contents with
///    a null terminator appended, or `nullptr` on failure. It must be freed
///    with `free` after use.
[[gnu::visibility("internal"), gnu::nonnull(1, 3, 4),
  gnu::access(read_only, 1), gnu::access(write_only, 3),
  gnu::access(write_only, 4), gnu::null_terminated_string_arg(1)]]
char *_Nullable ttcl_os_read_file(const char *_Nonnull path, tek_tc_errc prim,
                                  int *_Nonnull size, tek_tc_err *_Nonnull err);

/// Create a directory along with all missing parent directories.
///
/// @param [in] path
///    Path to the directory to create, as a null-terminated string.
/// @return Value indicating whether the directory exists after the call.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
bool ttcl_os_dir_create(const char *_Nonnull path);

/// Write data to a file, creating or truncating it.
///
/// @param [in] path
///    Path to the file to write, as a null-terminated string.
/// @param [in] data
///    Pointer to the data to write.
/// @param size
///    Number of bytes to write.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::access(read_only, 2, 3), gnu::null_terminated_string_arg(1)]]
tek_tc_err ttcl_os_write_file(const char *_Nonnull path,
                              const void *_Nullable data, size_t size);
