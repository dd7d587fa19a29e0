//===-- grab.cpp - bulk content retrieval implementation ------------------===//
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
/// Implementation of @ref tek_tc_grab and @ref tek_tc_grab_release.
///
/// The operation runs in two stages on a pool of worker threads. In the first
///    one, products are resolved, their install manifests are fetched and
///    filtered, items already present in the CKey map are skipped, and
///    encoding keys are looked up for the rest. In the second one, items are
///    fetched, decoded, verified and written. Written files are moved to their
///    final paths and recorded in the CKey map under its exclusive lock, so
///    the map never refers to a file that is not fully written.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/grab.h"

#include "cmap.hpp"
#include "common/error.h"
#include "content_ops.hpp"
#include "lib_ctx.hpp"
#include "os.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/cdn.h"
#include "tek-tactclient/cmap.h"
#include "tek-tactclient/content.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <regex>
#include <shared_mutex>
#include <span>
#include <stdatomic.h>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace tek::tactclient::grab {

namespace {

//===-- Private constants -------------------------------------------------===//

/// Patterns used when none are specified.
constexpr const char *default_patterns[]{R"(\.pdb$)", R"(_loader\.dll$)"};

//===-- Private types -----------------------------------------------------===//

/// Working state of a product.
struct product_ctx {
  /// Pointer to the outcome record of the product.
  tek_tc_grab_product *_Nonnull result;
  /// Resolved build state, valid if @ref resolved is `true`.
  tek_tc_build build;
  /// Value indicating whether @ref build must be released.
  bool resolved;
  /// Value indicating whether a worker has processed the product.
  bool processed;
};

/// Shared state of a running grab operation.
struct grab_ctx {
  /// Library context to use.
  tek_tc_lib_ctx &lib_ctx;
  /// Operation descriptor.
  tek_tc_grab_desc &desc;
  /// Optional cancellation flag.
  const atomic_bool *_Nullable cancel_flag;
  /// Compiled name patterns.
  std::vector<std::regex> patterns;
  /// Path to the destination directory, without trailing separator.
  std::string dest;
  /// CKey map of the destination directory.
  std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap;
  /// Working states of products, in input order.
  std::vector<product_ctx> products;
  /// Mutex serializing handler calls.
  std::mutex handler_mtx;
  /// Counter used to make temporary file names unique.
  std::atomic_uint tmp_counter;
};

//===-- Private functions -------------------------------------------------===//

/// Create a heap-allocated copy of a string.
char *_Nullable dup_str(std::string_view str) {
  const auto res{reinterpret_cast<char *>(std::malloc(str.length() + 1))};
  if (res) {
    std::memcpy(res, str.data(), str.length());
    res[str.length()] = '\0';
  }
  return res;
}

/// Create a copy of an error object with its own URI string.
tek_tc_err copy_err(const tek_tc_err &err) {
  auto res{err};
  if (err.uri) {
    res.uri = dup_str(err.uri);
  }
  return res;
}

/// Get product code for a friendly name or a code.
///
/// @param [in] name
///    Product name to resolve.
/// @return Product code, or `nullptr` if the name is unknown.
const char *_Nullable resolve_code(const char *_Nonnull name) {
  if (const auto code{tek_tc_product_code(name)}; code) {
    return code;
  }
  int num_names;
  const auto names{tek_tc_product_names(&num_names)};
  for (const auto product_name : std::span{names, names + num_names}) {
    const auto code{tek_tc_product_code(product_name)};
    if (code && std::strcmp(code, name) == 0) {
      return code;
    }
  }
  return nullptr;
}

/// Check whether a relative path stays within the directory it's relative to.
bool is_contained(std::string_view path) {
  if (path.empty() || path.starts_with('/')) {
    return false;
  }
  for (const auto comp : std::views::split(path, '/')) {
    const std::string_view comp_view{comp.begin(), comp.end()};
    if (comp_view.empty() || comp_view == "." || comp_view == "..") {
      return false;
    }
  }
  return true;
}

/// Insert a key string into a file path, before the extension of its name.
///
/// @param path
///    Relative file path.
/// @param key
///    Key string to insert.
/// @return `{stem}.{key}{ext}`, where `{ext}` is the extension of the file
///    name including the dot, or an empty string if it has none, and
///    `{stem}` is the rest of @p path.
std::string with_key(std::string_view path, std::string_view key) {
  const auto slash{path.rfind('/')};
  const auto name_start{slash == std::string_view::npos ? 0 : slash + 1};
  auto dot{path.rfind('.')};
  if (dot == std::string_view::npos || dot <= name_start) {
    dot = path.length();
  }
  std::string res{path.substr(0, dot)};
  res.push_back('.');
  res.append(key);
  res.append(path.substr(dot));
  return res;
}

/// Call the item handler, if there is one.
void report_item(grab_ctx &ctx, const product_ctx &prod,
                 const tek_tc_grab_item &item) {
  if (ctx.desc.item_handler) {
    const std::scoped_lock lock{ctx.handler_mtx};
    ctx.desc.item_handler(&ctx.desc, prod.result, &item);
  }
}

/// Call the product handler, if there is one.
void report_product(grab_ctx &ctx, const product_ctx &prod) {
  if (ctx.desc.product_handler) {
    const std::scoped_lock lock{ctx.handler_mtx};
    ctx.desc.product_handler(&ctx.desc, prod.result);
  }
}

/// Check whether the file for item's content key is already present in the
///    destination directory. Map records of files that are gone are removed.
///
/// @param [in, out] ctx
///    Grab operation context.
/// @param [in, out] item
///    Item to check. If present, it's moved to
///    @ref TEK_TC_GRAB_STATE_skipped.
/// @return Value indicating whether the item has been skipped.
bool check_present(grab_ctx &ctx, tek_tc_grab_item &item) {
  std::string path;
  {
    const std::shared_lock lock{ctx.cmap->mtx};
    const auto rec{cmap::find(*ctx.cmap, item.ckey)};
    if (!rec) {
      return false;
    }
    path = rec->path;
  }
  const auto full_path{ctx.dest + '/' + path};
  if (const auto size{ttci_os_path_get_size(full_path.c_str())};
      size != SIZE_MAX && size > 0) {
    if (ctx.desc.overwrite) {
      return false;
    }
    item.state = TEK_TC_GRAB_STATE_skipped;
    item.dest_path = dup_str(path);
    return true;
  }
  // The file is gone or empty, forget it
  const std::unique_lock lock{ctx.cmap->mtx};
  if (const auto rec{cmap::find(*ctx.cmap, item.ckey)};
      rec && rec->path == path) {
    cmap::remove(*ctx.cmap, item.ckey);
  }
  return false;
}

/// Resolve a product and fill its item list.
///
/// @param [in, out] ctx
///    Grab operation context.
/// @param [in, out] prod
///    Product to process.
void process_product(grab_ctx &ctx, product_ctx &prod) {
  prod.processed = true;
  auto &result{*prod.result};
  result.code = resolve_code(result.name);
  if (!result.code) {
    result.result = ttc_err_basic(TEK_TC_ERRC_unknown_product);
    report_product(ctx, prod);
    return;
  }
  prod.build = {.product = result.code, .region = ctx.desc.region};
  result.result = tek_tc_build_resolve(&ctx.lib_ctx, &prod.build,
                                       ctx.cancel_flag);
  if (!tek_tc_err_success(&result.result)) {
    report_product(ctx, prod);
    return;
  }
  prod.resolved = true;
  std::ranges::copy(prod.build.version.version, result.version);
  tek_tc_install_manifest manifest;
  result.result = tek_tc_build_fetch_install(&ctx.lib_ctx, &prod.build,
                                             &manifest, ctx.cancel_flag);
  if (!tek_tc_err_success(&result.result)) {
    report_product(ctx, prod);
    return;
  }
  const std::unique_ptr<tek_tc_install_manifest, decltype(&tek_tc_im_free)>
      manifest_guard{&manifest, tek_tc_im_free};
  // Filter manifest entries
  std::vector<const tek_tc_im_entry *> matches;
  std::size_t strs_size{};
  for (const auto &entry :
       std::span{manifest.entries, manifest.entries + manifest.num_entries}) {
    if (std::ranges::any_of(ctx.patterns, [&entry](const auto &pattern) {
          return std::regex_search(entry.path, pattern);
        })) {
      matches.emplace_back(&entry);
      strs_size += std::strlen(entry.path) + 1;
    }
  }
  if (matches.empty()) {
    report_product(ctx, prod);
    return;
  }
  // Allocate item array with path strings following it
  const auto items_size{sizeof(tek_tc_grab_item) * matches.size()};
  result.items = reinterpret_cast<tek_tc_grab_item *>(
      std::malloc(items_size + strs_size));
  if (!result.items) {
    result.result = ttc_err_basic(TEK_TC_ERRC_mem_alloc);
    report_product(ctx, prod);
    return;
  }
  result.num_items = static_cast<int>(matches.size());
  auto str_ptr{reinterpret_cast<char *>(result.items) + items_size};
  for (auto &&[item, entry] : std::views::zip(
           std::span{result.items, matches.size()}, matches)) {
    const auto len{std::strlen(entry->path) + 1};
    std::memcpy(str_ptr, entry->path, len);
    item = {.path = str_ptr,
            .ckey = entry->ckey,
            .ekey = {},
            .size = entry->size,
            .state = TEK_TC_GRAB_STATE_pending,
            .renamed = false,
            .dest_path = nullptr,
            .result = ttc_err_ok()};
    str_ptr += len;
  }
  // Skip items that are already present
  bool has_pending{};
  for (auto &item : std::span{result.items, matches.size()}) {
    if (check_present(ctx, item)) {
      report_item(ctx, prod, item);
    } else {
      has_pending = true;
    }
  }
  if (!has_pending) {
    report_product(ctx, prod);
    return;
  }
  // Look up encoding keys
  tek_tc_encoding enc;
  const auto enc_res{tek_tc_build_fetch_encoding(&ctx.lib_ctx, &prod.build,
                                                 &enc, ctx.cancel_flag)};
  if (!tek_tc_err_success(&enc_res)) {
    for (auto &item : std::span{result.items, matches.size()}) {
      if (item.state == TEK_TC_GRAB_STATE_pending) {
        item.state = TEK_TC_GRAB_STATE_fetch_failed;
        item.result = copy_err(enc_res);
        report_item(ctx, prod, item);
      }
    }
    result.result = enc_res;
    report_product(ctx, prod);
    return;
  }
  for (auto &item : std::span{result.items, matches.size()}) {
    if (item.state == TEK_TC_GRAB_STATE_pending &&
        !tek_tc_enc_find(&enc, &item.ckey, &item.ekey)) {
      item.state = TEK_TC_GRAB_STATE_fetch_failed;
      item.result =
          ttc_err_sub(TEK_TC_ERRC_fetch_data, TEK_TC_ERRC_ekey_not_found);
      report_item(ctx, prod, item);
    }
  }
  tek_tc_enc_free(&enc);
  report_product(ctx, prod);
}

/// Write item data to a temporary file in the directory of its destination.
///
/// @param [in, out] ctx
///    Grab operation context.
/// @param [in] item
///    Item being written.
/// @param [in] dir_path
///    Full path to the directory to write the file into.
/// @param [in] data
///    Decoded item data.
/// @param size
///    Size of @p data, in bytes.
/// @param [out] tmp_path
///    Variable that receives full path to the written file.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err write_tmp(grab_ctx &ctx, const tek_tc_grab_item &item,
                     const std::string &dir_path, const void *_Nullable data,
                     int size, std::string &tmp_path) {
  if (!ttci_os_dir_create(dir_path.c_str())) {
    return ttci_os_io_err(dir_path.c_str(), TEK_TC_ERRC_write_failed,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  tmp_path = dir_path;
  tmp_path.push_back('/');
  tmp_path.append(cmap::tmp_prefix);
  tmp_path.append(to_string(item.ckey));
  tmp_path.push_back('-');
  tmp_path.append(std::to_string(
      ctx.tmp_counter.fetch_add(1, std::memory_order_relaxed)));
  tmp_path.append(cmap::tmp_suffix);
  const auto handle{ttci_os_file_create(tmp_path.c_str())};
  if (handle == TTCI_OS_INVALID_HANDLE) {
    return ttci_os_io_err(tmp_path.c_str(), TEK_TC_ERRC_write_failed,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  const bool written{ttci_os_file_write(handle, data, size)};
  const auto errc{ttci_os_get_last_error()};
  ttci_os_close_handle(handle);
  if (!written) {
    ttci_os_file_delete(tmp_path.c_str());
    return ttci_os_io_err(tmp_path.c_str(), TEK_TC_ERRC_write_failed, errc,
                          TEK_TC_ERR_IO_TYPE_write);
  }
  return ttc_err_ok();
}

/// Choose the final path for an item. The caller must hold an exclusive lock
///    on the CKey map.
///
/// @param [in] ctx
///    Grab operation context.
/// @param [in] path
///    Preferred path relative to the destination directory.
/// @param [in] ckey
///    Content key of the item.
/// @param [out] existed
///    Variable that receives value indicating whether a file exists at the
///    returned path.
/// @return Path relative to the destination directory.
std::string choose_path(const grab_ctx &ctx, const std::string &path,
                        const tek_tc_hash &ckey, bool &existed) {
  const auto is_free{[&ctx, &existed](const std::string &candidate) {
    const auto full_path{ctx.dest + '/' + candidate};
    existed = ttci_os_path_exists(full_path.c_str()) == 0;
    return !existed;
  }};
  const auto owned_by{[&ctx, &ckey](const std::string &candidate) {
    const auto mapped{cmap::find_path(*ctx.cmap, candidate)};
    return mapped && *mapped == ckey;
  }};
  if (is_free(path) || owned_by(path)) {
    return path;
  }
  if (!cmap::find_path(*ctx.cmap, path)) {
    // An unrecorded file may be replaced if overwriting, or if it's
    //    identical
    if (ctx.desc.overwrite) {
      return path;
    }
    tek_tc_hash file_ckey;
    const auto full_path{ctx.dest + '/' + path};
    if (auto res{ttci_u_md5_file(full_path.c_str(), TEK_TC_ERRC_write_failed,
                                 &file_ckey)};
        tek_tc_err_success(&res)) {
      if (file_ckey == ckey) {
        return path;
      }
    } else {
      tek_tc_err_release(&res);
    }
  }
  const auto key{to_string(ckey)};
  auto res{with_key(path, std::string_view{key}.substr(0, 8))};
  if (is_free(res) || owned_by(res)) {
    return res;
  }
  res = with_key(path, key);
  is_free(res);
  return res;
}

/// Fetch, decode, verify and write an item.
///
/// @param [in, out] ctx
///    Grab operation context.
/// @param [in] prod
///    Product that the item belongs to.
/// @param [in, out] item
///    Item to process.
void process_item(grab_ctx &ctx, const product_ctx &prod,
                  tek_tc_grab_item &item) {
  // Another item with the same content key may have been written meanwhile
  if (check_present(ctx, item)) {
    report_item(ctx, prod, item);
    return;
  }
  item.state = TEK_TC_GRAB_STATE_fetching;
  void *data;
  int size;
  item.result = tek_tc_cdn_fetch(&ctx.lib_ctx, &prod.build.cdn, false,
                                 &item.ekey, &data, &size, ctx.cancel_flag);
  if (!tek_tc_err_success(&item.result)) {
    item.state = TEK_TC_GRAB_STATE_fetch_failed;
    report_item(ctx, prod, item);
    return;
  }
  item.state = TEK_TC_GRAB_STATE_fetched;
  const unique_buf blte_buf{data, std::free};
  item.state = TEK_TC_GRAB_STATE_decoding;
  item.result = tek_tc_blte_decode(data, size, &data, &size);
  if (!tek_tc_err_success(&item.result)) {
    item.state = TEK_TC_GRAB_STATE_decode_failed;
    report_item(ctx, prod, item);
    return;
  }
  const unique_buf content_buf{data, std::free};
  tek_tc_hash ckey;
  if (!ttci_u_md5(data, size, &ckey)) {
    item.state = TEK_TC_GRAB_STATE_decode_failed;
    item.result = ttc_err_basic(TEK_TC_ERRC_md5);
    report_item(ctx, prod, item);
    return;
  }
  if (ckey != item.ckey) {
    item.state = TEK_TC_GRAB_STATE_decode_failed;
    item.result = ttc_err_basic(TEK_TC_ERRC_content_mismatch);
    report_item(ctx, prod, item);
    return;
  }
  item.state = TEK_TC_GRAB_STATE_decoded;
  item.state = TEK_TC_GRAB_STATE_writing;
  std::string rel_path{prod.result->name};
  rel_path.push_back('/');
  rel_path.append(prod.result->version);
  rel_path.push_back('/');
  rel_path.append(normalize_path(item.path));
  if (!is_contained(rel_path)) {
    item.state = TEK_TC_GRAB_STATE_write_failed;
    item.result =
        ttc_err_sub(TEK_TC_ERRC_write_failed, TEK_TC_ERRC_invalid_data);
    report_item(ctx, prod, item);
    return;
  }
  const auto slash{rel_path.rfind('/')};
  std::string tmp_path;
  item.result = write_tmp(ctx, item, ctx.dest + '/' + rel_path.substr(0, slash),
                          data, size, tmp_path);
  if (!tek_tc_err_success(&item.result)) {
    item.state = TEK_TC_GRAB_STATE_write_failed;
    report_item(ctx, prod, item);
    return;
  }
  {
    const std::unique_lock lock{ctx.cmap->mtx};
    if (!ctx.desc.overwrite) {
      if (const auto rec{cmap::find(*ctx.cmap, item.ckey)}; rec) {
        const auto full_path{ctx.dest + '/' + rec->path};
        if (const auto file_size{ttci_os_path_get_size(full_path.c_str())};
            file_size != SIZE_MAX && file_size > 0) {
          ttci_os_file_delete(tmp_path.c_str());
          item.state = TEK_TC_GRAB_STATE_skipped;
          item.result = ttc_err_ok();
          item.dest_path = dup_str(rec->path);
          goto report;
        }
      }
    }
    bool existed;
    const auto final_path{choose_path(ctx, rel_path, item.ckey, existed)};
    const auto full_path{ctx.dest + '/' + final_path};
    if (!ttci_os_file_move(tmp_path.c_str(), full_path.c_str())) {
      const auto errc{ttci_os_get_last_error()};
      ttci_os_file_delete(tmp_path.c_str());
      item.state = TEK_TC_GRAB_STATE_write_failed;
      item.result = ttci_os_io_err(full_path.c_str(), TEK_TC_ERRC_write_failed,
                                   errc, TEK_TC_ERR_IO_TYPE_move);
      goto report;
    }
    // Remember what the insertion replaces, to restore it if saving fails
    std::optional<cmap::record> prev_rec;
    if (const auto rec{cmap::find(*ctx.cmap, item.ckey)}; rec) {
      prev_rec = *rec;
    }
    std::optional<std::pair<tek_tc_hash, cmap::record>> displaced;
    if (const auto mapped{cmap::find_path(*ctx.cmap, final_path)};
        mapped && *mapped != item.ckey) {
      displaced.emplace(*mapped, *cmap::find(*ctx.cmap, *mapped));
    }
    cmap::insert(*ctx.cmap, item.ckey,
                 {.path = final_path,
                  .product = prod.result->name,
                  .version = prod.result->version});
    item.result = cmap::save(*ctx.cmap);
    if (!tek_tc_err_success(&item.result)) {
      cmap::remove(*ctx.cmap, item.ckey);
      if (displaced) {
        cmap::insert(*ctx.cmap, displaced->first,
                     std::move(displaced->second));
      }
      if (prev_rec) {
        cmap::insert(*ctx.cmap, item.ckey, std::move(*prev_rec));
      }
      if (!existed) {
        ttci_os_file_delete(full_path.c_str());
      }
      item.state = TEK_TC_GRAB_STATE_write_failed;
      goto report;
    }
    item.state = TEK_TC_GRAB_STATE_written;
    item.renamed = final_path != rel_path;
    item.dest_path = dup_str(final_path);
  }
report:
  report_item(ctx, prod, item);
}

/// Run a function for indices `[0, count)` on a pool of worker threads,
///    including the calling one. Workers stop taking new indices when
///    cancellation is requested.
///
/// @param [in] ctx
///    Grab operation context.
/// @param count
///    Number of indices to process.
/// @param func
///    Function to call for each index.
template <typename F>
void run_workers(const grab_ctx &ctx, int count, F &&func) {
  std::atomic_int next{};
  const auto worker{[&] {
    for (;;) {
      if (is_cancelled(ctx.cancel_flag)) {
        return;
      }
      const int index{next.fetch_add(1, std::memory_order_relaxed)};
      if (index >= count) {
        return;
      }
      func(index);
    }
  }};
  const int num_threads{std::min(ctx.lib_ctx.num_threads, count) - 1};
  std::vector<std::thread> threads;
  threads.reserve(std::max(num_threads, 0));
  for (int i{}; i < num_threads; ++i) {
    try {
      threads.emplace_back(worker);
    } catch (const std::system_error &) {
      // Continue with the threads that have started
      break;
    }
  }
  worker();
  for (auto &thread : threads) {
    thread.join();
  }
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_grab(tek_tc_lib_ctx *lib_ctx, tek_tc_grab_desc *desc,
                       const atomic_bool *cancel_flag) {
  desc->results = nullptr;
  desc->num_results = 0;
  desc->num_written = 0;
  desc->num_skipped = 0;
  desc->num_failed = 0;
  desc->cmap_warning = ttc_err_ok();
  grab_ctx ctx{.lib_ctx = *lib_ctx,
               .desc = *desc,
               .cancel_flag = cancel_flag,
               .patterns = {},
               .dest = desc->dest,
               .cmap = {nullptr, tek_tc_cmap_destroy},
               .products = {},
               .handler_mtx = {},
               .tmp_counter = {}};
  // Compile patterns
  const std::span patterns{
      desc->patterns ? desc->patterns : default_patterns,
      static_cast<std::size_t>(desc->patterns ? desc->num_patterns
                                              : std::size(default_patterns))};
  try {
    for (const auto pattern : patterns) {
      ctx.patterns.emplace_back(pattern, std::regex::ECMAScript |
                                             std::regex::icase |
                                             std::regex::optimize);
    }
  } catch (const std::regex_error &) {
    return ttc_err_basic(TEK_TC_ERRC_invalid_pattern);
  }
  // Prepare the destination
  while (ctx.dest.length() > 1 && ctx.dest.ends_with('/')) {
    ctx.dest.pop_back();
  }
  if (!ttci_os_dir_create(ctx.dest.c_str())) {
    return ttci_os_io_err(ctx.dest.c_str(), TEK_TC_ERRC_write_failed,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  ctx.cmap.reset(tek_tc_cmap_load(ctx.dest.c_str(), &desc->cmap_warning));
  if (!ctx.cmap) {
    return ttc_err_basic(TEK_TC_ERRC_mem_alloc);
  }
  // Prepare product records
  int num_products{desc->num_products};
  const char *const *names{desc->products};
  if (!names) {
    names = tek_tc_product_names(&num_products);
  }
  if (num_products > 0) {
    desc->results = reinterpret_cast<tek_tc_grab_product *>(
        std::calloc(num_products, sizeof *desc->results));
    if (!desc->results) {
      return ttc_err_basic(TEK_TC_ERRC_mem_alloc);
    }
  }
  desc->num_results = num_products;
  ctx.products.reserve(num_products);
  for (int i{}; i < num_products; ++i) {
    auto &result{desc->results[i]};
    result.name = names[i];
    result.result = ttc_err_ok();
    ctx.products.push_back({.result = &result,
                            .build = {},
                            .resolved = false,
                            .processed = false});
  }
  // Stage 1: resolve products
  run_workers(ctx, num_products,
              [&ctx](int index) { process_product(ctx, ctx.products[index]); });
  // Stage 2: process items
  std::vector<std::pair<const product_ctx *, tek_tc_grab_item *>> queue;
  for (const auto &prod : ctx.products) {
    for (auto &item :
         std::span{prod.result->items,
                   static_cast<std::size_t>(prod.result->num_items)}) {
      if (item.state == TEK_TC_GRAB_STATE_pending) {
        queue.emplace_back(&prod, &item);
      }
    }
  }
  run_workers(ctx, static_cast<int>(queue.size()), [&ctx, &queue](int index) {
    process_item(ctx, *queue[index].first, *queue[index].second);
  });
  for (auto &prod : ctx.products) {
    if (prod.resolved) {
      tek_tc_build_release(&prod.build);
    }
  }
  // Summarize outcomes
  int num_failed_products{};
  int num_attempted{};
  for (const auto &prod : ctx.products) {
    auto &result{*prod.result};
    if (!prod.processed) {
      result.result = ttc_err_basic(TEK_TC_ERRC_cancelled);
    }
    if (!tek_tc_err_success(&result.result)) {
      ++num_failed_products;
    }
    for (auto &item :
         std::span{result.items, static_cast<std::size_t>(result.num_items)}) {
      switch (item.state) {
      case TEK_TC_GRAB_STATE_pending:
        item.result = ttc_err_basic(TEK_TC_ERRC_cancelled);
        break;
      case TEK_TC_GRAB_STATE_skipped:
        ++desc->num_skipped;
        break;
      case TEK_TC_GRAB_STATE_written:
        ++desc->num_written;
        ++num_attempted;
        break;
      case TEK_TC_GRAB_STATE_fetch_failed:
      case TEK_TC_GRAB_STATE_decode_failed:
      case TEK_TC_GRAB_STATE_write_failed:
        ++desc->num_failed;
        ++num_attempted;
        break;
      default:
        break;
      }
    }
  }
  if (is_cancelled(cancel_flag)) {
    return ttc_err_basic(TEK_TC_ERRC_cancelled);
  }
  if ((num_products > 0 && num_failed_products == num_products) ||
      (num_attempted > 0 && desc->num_failed == num_attempted)) {
    return ttc_err_basic(TEK_TC_ERRC_all_failed);
  }
  return ttc_err_ok();
}

void tek_tc_grab_release(tek_tc_grab_desc *desc) {
  for (auto &result : std::span{desc->results,
                                static_cast<std::size_t>(desc->num_results)}) {
    for (auto &item : std::span{result.items,
                                static_cast<std::size_t>(result.num_items)}) {
      std::free(item.dest_path);
      tek_tc_err_release(&item.result);
    }
    std::free(result.items);
    tek_tc_err_release(&result.result);
  }
  std::free(desc->results);
  desc->results = nullptr;
  desc->num_results = 0;
  tek_tc_err_release(&desc->cmap_warning);
}

} // extern "C"

} // namespace tek::tactclient::grab
