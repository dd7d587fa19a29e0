//===-- common.h - common tek-tc-cli declarations -------------------------===//
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
/// Declarations of types, global variables and functions used across multiple
///    modules.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/error.h"

#include <stdatomic.h>
#include <stdint.h>
#ifdef TEK_TCB_GETTEXT
#include <libintl.h>

[[gnu::returns_nonnull, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]] static inline const char
    *_Nonnull ttcl_gettext(const char *_Nonnull msg) {
  return dgettext("tek-tactclient", msg);
}

#else // def TEK_TCB_GETTEXT

#define ttcl_gettext(msg) msg

#endif // def TEK_TCB_GETTEXT else

/// Global tek-tc-cli context.
typedef struct ttcl_ctx ttcl_ctx;
/// @copydoc ttcl_ctx
struct ttcl_ctx {
  /// Pointer to the tek-tactclient library context.
  tek_tc_lib_ctx *_Nullable lib_ctx;
  /// Region name to select table records for, or `nullptr` for the first
  ///    record.
  const char *_Nullable region;
  /// Flag set when the program is interrupted, passed to library operations
  ///    as the cancellation flag.
  atomic_bool terminating;
};

/// Command types.
enum ttcl_cmd_type {
  /// Display help message.
  TTCL_CMD_TYPE_help,
  /// Display program version.
  TTCL_CMD_TYPE_version_info,
  /// Display the version record of a product.
  TTCL_CMD_TYPE_version,
  /// Display the CDN entry of a product.
  TTCL_CMD_TYPE_cdn,
  /// List install manifest entries of a product.
  TTCL_CMD_TYPE_install_manifest,
  /// Download a file of a product by its content key.
  TTCL_CMD_TYPE_download,
  /// Grab files matching patterns from multiple products.
  TTCL_CMD_TYPE_grab,
  /// Index a directory into a CKey map.
  TTCL_CMD_TYPE_index
};
/// @copydoc ttcl_cmd_type
typedef enum ttcl_cmd_type ttcl_cmd_type;

/// Command descriptor.
typedef struct ttcl_command ttcl_command;
/// @copydoc ttcl_command
struct ttcl_command {
  /// Type of the command.
  ttcl_cmd_type type;
  union {
    /// "version", "cdn", "install-manifest" and "download" command arguments.
    struct {
      /// Product name, as a null-terminated string.
      const char *_Nonnull product;
      /// Optional path to the file with version table text.
      const char *_Nullable version_file;
      /// Optional path to the file with build configuration text.
      const char *_Nullable config_file;
      /// For "download", content key of the file to download.
      tek_tc_hash ckey;
      /// For "download", path to the output directory.
      const char *_Nonnull output;
    } product;
    /// "grab" command arguments.
    struct {
      /// Pointer to the array of patterns, or `nullptr` for default ones.
      ///    Must be freed with `free` after use.
      const char *_Nonnull *_Nullable patterns;
      /// Number of entries pointed to by @ref patterns.
      int num_patterns;
      /// Path to the destination directory.
      const char *_Nonnull dest;
      /// Optional path to the file listing product names, one per line.
      const char *_Nullable product_file;
      /// Optional single product name.
      const char *_Nullable product;
      /// Value indicating whether files present in the CKey map should be
      ///    downloaded again.
      bool overwrite;
    } grab;
    /// "index" command arguments.
    struct {
      /// Path to the directory to index.
      const char *_Nonnull dir;
      /// Optional path to the directory to save the CKey map to.
      const char *_Nullable dest;
      /// Optional base directory for relative paths.
      const char *_Nullable base_dir;
    } index;
  }; // union
};

/// Global instance of @ref ttcl_ctx.
extern ttcl_ctx ttcl_g_ctx;

/// Display an error message for specified tek-tactclient error.
///
/// @param [in] err
///    Pointer to the tek-tactclient error object to display message for.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
void ttcl_print_err(const tek_tc_err *_Nonnull err);

/// Display usage information.
[[gnu::visibility("internal")]]
void ttcl_print_help(void);

/// Process command-line arguments.
///
/// @param argc
///    Number of arguments passed to the program.
/// @param [in] argv
///    Pointer to the array of arguments passed to the program.
/// @param [out] cfg
///    Address of variable that receives library configuration set by global
///    options.
/// @param [out] cmd
///    Address of variable that receives the parsed command descriptor.
/// @return Value indicating whether parsing succeeded.
[[gnu::visibility("internal"), gnu::nonnull(2, 3, 4),
  gnu::access(read_only, 2, 1), gnu::access(write_only, 3),
  gnu::access(write_only, 4)]]
bool ttcl_process_args(int argc, char *_Nonnull *_Nonnull argv,
                       tek_tc_lib_cfg *_Nonnull cfg,
                       ttcl_command *_Nonnull cmd);

/// Run a command.
///
/// @param [in] cmd
///    Pointer to the descriptor of the command to run.
/// @return Value indicating whether execution succeeded.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bool ttcl_run_cmd(const ttcl_command *_Nonnull cmd);
