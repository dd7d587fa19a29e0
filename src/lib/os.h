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
/// Declarations of macros, types and functions that are implemented
///    differently on different operating systems. Implementations are provided
///    by corresponding os_*.c.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/base.h" // IWYU pragma: keep
#include "tek-tactclient/error.h"

#include <errno.h> // IWYU pragma: keep
#include <stddef.h>
#include <stdint.h>

//===-- OS-specific declarations ------------------------------------------===//

/// @def TTCI_OS_ERR_ALREADY_EXISTS
/// @ref ttci_os_errc value indicating that target file/directory already
///    exists.
#define TTCI_OS_ERR_ALREADY_EXISTS EEXIST
/// @def TTCI_OS_ERR_FILE_NOT_FOUND
/// @ref ttci_os_errc value indicating that a file was not found.
#define TTCI_OS_ERR_FILE_NOT_FOUND ENOENT
/// @def TTCI_OS_INVALID_HANDLE
/// Invalid value for @ref ttci_os_handle.
#define TTCI_OS_INVALID_HANDLE -1
/// @def TTCI_OS_PATH_SEP_CHAR_STR
/// Path separator character for current operating system as a string literal.
#define TTCI_OS_PATH_SEP_CHAR_STR "/"

/// OS file handle type.
typedef int ttci_os_handle;
/// OS error code type.
typedef int ttci_os_errc;

//===-- OS-independent types ----------------------------------------------===//

/// Prototype of a callback function receiving files found by
///    @ref ttci_os_dir_walk.
///
/// @param [in, out] user_data
///    Value passed to @ref ttci_os_dir_walk.
/// @param [in] rel_path
///    Path of the file relative to the walked directory, using `/` as
///    separator, as a null-terminated string.
/// @return Value indicating whether the walk should continue.
typedef bool ttci_os_dir_walk_func(void *_Nullable user_data,
                                   const char *_Nonnull rel_path);

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===--- General ----------------------------------------------------------===//

/// Close an OS file handle.
///
/// @param handle
///    OS handle to close.
[[gnu::visibility("internal"), gnu::fd_arg(1)]]
void ttci_os_close_handle(ttci_os_handle handle);

/// Get message for specified error code.
///
/// @param errc
///    OS error code to get message for.
/// @return Human-readable message for @p errc, as a heap-allocated
///    null-terminated string, or `nullptr` if memory allocation fails. It
///    must be freed with `free` after use.
[[gnu::visibility("internal")]]
char *_Nullable ttci_os_get_err_msg(ttci_os_errc errc);

/// Get the last error code set by a system call.
///
/// @return The last OS error code.
[[gnu::visibility("internal")]] ttci_os_errc ttci_os_get_last_error(void);

/// Get the number of logical processors available to the process.
///
/// @return The number of logical processors, at least 1.
[[gnu::visibility("internal")]] int ttci_os_get_nproc(void);

/// Create an I/O error object for specified path and OS error code.
///
/// @param [in] path
///    Path to the file or directory that was subject to failed I/O operation,
///    as a null-terminated string.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref tek_tc_err describing the I/O error.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
tek_tc_err ttci_os_io_err(const char *_Nonnull path, tek_tc_errc prim,
                          ttci_os_errc errc, tek_tc_err_io_type io_type);

/// Check if a file or directory exists.
///
/// @param [in] path
///    Pathname to check existence of, as a null-terminated string.
/// @return `0` if specified pathname exists, @ref TTCI_OS_ERR_FILE_NOT_FOUND if
///    it doesn't, other OS error code values if an error occurs.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
ttci_os_errc ttci_os_path_exists(const char *_Nonnull path);

/// Get size of a file.
///
/// @param [in] path
///    Path to the file, as a null-terminated string.
/// @return Size of the file, in bytes, or `SIZE_MAX` if the function fails.
///    Call @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
size_t ttci_os_path_get_size(const char *_Nonnull path);

/// Get canonical absolute path of an existing file or directory.
///
/// @param [in] path
///    Path to resolve, as a null-terminated string.
/// @return Resolved path, as a heap-allocated null-terminated string, or
///    `nullptr` if the function fails. Call @ref ttci_os_get_last_error to get
///    the error code. It must be freed with `free` after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
char *_Nullable ttci_os_real_path(const char *_Nonnull path);

//===--- Directories ------------------------------------------------------===//

/// Create a directory along with all missing parent directories.
///
/// @param [in] path
///    Path to the directory to create, as a null-terminated string.
/// @return Value indicating whether the directory exists after the call. Call
///    @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
bool ttci_os_dir_create(const char *_Nonnull path);

/// Recursively enumerate regular files in a directory.
///
/// @param [in] path
///    Path to the directory to walk, as a null-terminated string.
/// @param [in] cb
///    Pointer to the function that is called for every regular file.
/// @param [in, out] user_data
///    Value to pass to @p cb.
/// @return `0` if the walk has completed, `ECANCELED` if @p cb has stopped it,
///    other OS error code values if reading a directory failed.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
ttci_os_errc ttci_os_dir_walk(const char *_Nonnull path,
                              ttci_os_dir_walk_func *_Nonnull cb,
                              void *_Nullable user_data);

//===--- Files ------------------------------------------------------------===//

/// Create a file for writing, or truncate it if it exists.
///
/// @param [in] path
///    Path to the file to create, as a null-terminated string.
/// @return Handle for the created file, or @ref TTCI_OS_INVALID_HANDLE if the
///    function fails. Call @ref ttci_os_get_last_error to get the error code.
///    The handle must be closed with @ref ttci_os_close_handle after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
ttci_os_handle ttci_os_file_create(const char *_Nonnull path);

/// Open a file for reading.
///
/// @param [in] path
///    Path to the file to open, as a null-terminated string.
/// @return Handle for the opened file, or @ref TTCI_OS_INVALID_HANDLE if the
///    function fails. Call @ref ttci_os_get_last_error to get the error code.
///    The handle must be closed with @ref ttci_os_close_handle after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
ttci_os_handle ttci_os_file_open(const char *_Nonnull path);

/// Read data from file.
///
/// @param handle
///    OS handle for the file.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param n
///    Number of bytes to read.
/// @return Value indicating whether all @p n bytes were read. Call
///    @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::fd_arg_read(1), gnu::nonnull(2),
  gnu::access(write_only, 2, 3)]]
bool ttci_os_file_read(ttci_os_handle handle, void *_Nonnull buf, size_t n);

/// Write data to file.
///
/// @param handle
///    OS handle for the file.
/// @param [in] buf
///    Pointer to the buffer containing the data to write.
/// @param n
///    Number of bytes to write.
/// @return Value indicating whether all @p n bytes were written. Call
///    @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::fd_arg_write(1),
  gnu::access(read_only, 2, 3)]]
bool ttci_os_file_write(ttci_os_handle handle, const void *_Nullable buf,
                        size_t n);

/// Get size of an open file.
///
/// @param handle
///    OS handle for the file.
/// @return Size of the file, in bytes, or `SIZE_MAX` if the function fails.
///    Call @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::fd_arg(1)]]
size_t ttci_os_file_get_size(ttci_os_handle handle);

/// Move a file, replacing the target if it exists.
///
/// @param [in] src
///    Current path of the file, as a null-terminated string.
/// @param [in] dst
///    New path of the file, as a null-terminated string.
/// @return Value indicating whether the operation succeeded. Call
///    @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(1),
  gnu::null_terminated_string_arg(2)]]
bool ttci_os_file_move(const char *_Nonnull src, const char *_Nonnull dst);

/// Delete a file.
///
/// @param [in] path
///    Path to the file to delete, as a null-terminated string.
/// @return Value indicating whether the operation succeeded. Call
///    @ref ttci_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
bool ttci_os_file_delete(const char *_Nonnull path);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
