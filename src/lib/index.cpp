//===-- index.cpp - CKey map indexing implementation ----------------------===//
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
/// Implementation of @ref tek_tc_build_index.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/grab.h"

#include "cmap.hpp"
#include "common/error.h"
#include "lib_ctx.hpp"
#include "os.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/cmap.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdatomic.h>
#include <string>
#include <string_view>
#include <vector>

namespace tek::tactclient::grab {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Directory walk state.
struct walk_ctx {
  /// Optional cancellation flag.
  const atomic_bool *_Nullable cancel_flag;
  /// Paths of found files relative to the walked directory.
  std::vector<std::string> files;
};

//===-- Private functions -------------------------------------------------===//

/// Check whether a file name belongs to the CKey map or to a temporary file.
bool is_service_file(std::string_view name) {
  return name == TEK_TC_CMAP_FILE_NAME ||
         (name.ends_with(cmap::tmp_suffix) &&
          (name.starts_with(cmap::tmp_prefix) ||
           name.starts_with(TEK_TC_CMAP_FILE_NAME)));
}

/// @ref ttci_os_dir_walk_func collecting file paths.
bool collect_file(void *_Nullable user_data, const char *_Nonnull rel_path) {
  auto &ctx{*reinterpret_cast<walk_ctx *>(user_data)};
  if (is_cancelled(ctx.cancel_flag)) {
    return false;
  }
  const std::string_view path{rel_path};
  const auto slash{path.rfind('/')};
  if (!is_service_file(
          slash == std::string_view::npos ? path : path.substr(slash + 1))) {
    ctx.files.emplace_back(path);
  }
  return true;
}

/// Get a path relative to a directory.
///
/// @param path
///    Absolute path.
/// @param dir
///    Absolute path to the directory.
/// @return The relative path, or an empty string if @p path is not under
///    @p dir.
std::string_view relative_to(std::string_view path, std::string_view dir) {
  if (dir == "/") {
    return path.substr(1);
  }
  if (path.length() <= dir.length() + 1 || !path.starts_with(dir) ||
      path[dir.length()] != '/') {
    return {};
  }
  return path.substr(dir.length() + 1);
}

/// Split a path relative to a base directory into product name, version and
///    the rest.
///
/// @param path
///    Relative path.
/// @param [out] product
///    Variable that receives product name.
/// @param [out] version
///    Variable that receives version string.
/// @return Value indicating whether @p path has a product and a version
///    directory followed by a file path.
bool split_path(std::string_view path, std::string_view &product,
                std::string_view &version) {
  const auto first{path.find('/')};
  if (first == std::string_view::npos || first == 0) {
    return false;
  }
  const auto second{path.find('/', first + 1)};
  if (second == std::string_view::npos || second == first + 1 ||
      second == path.length() - 1) {
    return false;
  }
  product = path.substr(0, first);
  version = path.substr(first + 1, second - first - 1);
  return true;
}

/// Get a resolved copy of a path with trailing separators stripped.
std::unique_ptr<char, decltype(&std::free)> resolve(const char *_Nonnull path) {
  std::string str{path};
  while (str.length() > 1 && str.ends_with('/')) {
    str.pop_back();
  }
  return {ttci_os_real_path(str.c_str()), std::free};
}

} // namespace

//===-- Public function ---------------------------------------------------===//

extern "C" tek_tc_err tek_tc_build_index(tek_tc_index_desc *desc,
                                         const atomic_bool *cancel_flag) {
  desc->num_indexed = 0;
  desc->num_skipped = 0;
  desc->num_entries = 0;
  desc->cmap_warning = ttc_err_ok();
  const auto dir{resolve(desc->dir)};
  if (!dir) {
    return ttci_os_io_err(desc->dir, TEK_TC_ERRC_index_build,
                          ttci_os_get_last_error(),
                          TEK_TC_ERR_IO_TYPE_check_existence);
  }
  std::string dest{desc->dest ? desc->dest : dir.get()};
  if (!ttci_os_dir_create(dest.c_str())) {
    return ttci_os_io_err(dest.c_str(), TEK_TC_ERRC_index_build,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  const auto real_dest{resolve(dest.c_str())};
  if (!real_dest) {
    return ttci_os_io_err(dest.c_str(), TEK_TC_ERRC_index_build,
                          ttci_os_get_last_error(),
                          TEK_TC_ERR_IO_TYPE_check_existence);
  }
  std::unique_ptr<char, decltype(&std::free)> base{nullptr, std::free};
  if (desc->base_dir) {
    base = resolve(desc->base_dir);
    if (!base) {
      return ttci_os_io_err(desc->base_dir, TEK_TC_ERRC_index_build,
                            ttci_os_get_last_error(),
                            TEK_TC_ERR_IO_TYPE_check_existence);
    }
  }
  const std::string_view base_path{base ? base.get() : real_dest.get()};
  const std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap{
      tek_tc_cmap_load(real_dest.get(), &desc->cmap_warning),
      tek_tc_cmap_destroy};
  if (!cmap) {
    return ttc_err_basic(TEK_TC_ERRC_mem_alloc);
  }
  // Enumerate files
  walk_ctx ctx{.cancel_flag = cancel_flag, .files = {}};
  if (const auto errc{ttci_os_dir_walk(dir.get(), collect_file, &ctx)};
      errc && errc != ECANCELED) {
    return ttci_os_io_err(dir.get(), TEK_TC_ERRC_index_build, errc,
                          TEK_TC_ERR_IO_TYPE_read_dir);
  }
  // Hash them and record in the map
  const std::string_view dir_path{dir.get()};
  for (const auto &file : ctx.files) {
    if (is_cancelled(cancel_flag)) {
      break;
    }
    std::string full_path{dir_path};
    if (!full_path.ends_with('/')) {
      full_path.push_back('/');
    }
    full_path.append(file);
    std::string_view product;
    std::string_view version;
    auto rel_path{relative_to(full_path, base_path)};
    if (rel_path.empty() || !split_path(rel_path, product, version)) {
      rel_path = file;
      if (!split_path(rel_path, product, version)) {
        ++desc->num_skipped;
        continue;
      }
    }
    tek_tc_hash ckey;
    if (auto res{ttci_u_md5_file(full_path.c_str(), TEK_TC_ERRC_index_build,
                                 &ckey)};
        !tek_tc_err_success(&res)) {
      tek_tc_err_release(&res);
      ++desc->num_skipped;
      continue;
    }
    const std::unique_lock lock{cmap->mtx};
    cmap::insert(*cmap, ckey,
                 {.path = std::string{rel_path},
                  .product = std::string{product},
                  .version = std::string{version}});
    ++desc->num_indexed;
  }
  const std::unique_lock lock{cmap->mtx};
  desc->num_entries = static_cast<int>(cmap->records.size());
  if (auto res{cmap::save(*cmap)}; !tek_tc_err_success(&res)) {
    return res;
  }
  return is_cancelled(cancel_flag) ? ttc_err_basic(TEK_TC_ERRC_cancelled)
                                   : ttc_err_ok();
}

} // namespace tek::tactclient::grab
