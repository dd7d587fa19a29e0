//===-- cdn.cpp - version/CDN resolution and CDN downloads ----------------===//
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
/// Implementation of functions resolving product builds and fetching their
///    content from CDN hosts.
///
//===----------------------------------------------------------------------===//
#include "tek-tactclient/cdn.h"

#include "common/error.h"
#include "content_ops.hpp"
#include "lib_ctx.hpp"
#include "tek-tactclient/base.h"
#include "tek-tactclient/content.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <cstdlib>
#include <stdatomic.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tek::tactclient::cdn {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Build URLs of a file for every endpoint of a CDN entry, in the order they
///    should be tried.
///
/// @param [in] lib_ctx
///    Library context providing the scheme setting.
/// @param [in] cdn
///    CDN entry providing hosts and path layout.
/// @param is_config
///    Value indicating whether the file is in the `config` directory rather
///    than `data`.
/// @param [in] key
///    Hash of the file.
/// @return List of URLs.
std::vector<std::string> get_urls(const tek_tc_lib_ctx &lib_ctx,
                                  const tek_tc_cdn_entry &cdn, bool is_config,
                                  const tek_tc_hash &key) {
  const auto key_str{to_string(key)};
  std::string suffix{"/"};
  suffix.append(cdn.path ? cdn.path : "");
  suffix.append(is_config ? "/config/" : "/data/");
  suffix.append(key_str, 0, 2);
  suffix.push_back('/');
  suffix.append(key_str, 2, 2);
  suffix.push_back('/');
  suffix.append(key_str);
  const std::string_view scheme{lib_ctx.use_http ? "http://" : "https://"};
  std::vector<std::string> urls;
  urls.reserve(cdn.num_hosts + cdn.num_servers);
  for (int i = 0; i < cdn.num_hosts; ++i) {
    std::string url{scheme};
    url.append(cdn.hosts[i]).append(suffix);
    urls.emplace_back(std::move(url));
  }
  for (int i = 0; i < cdn.num_servers; ++i) {
    std::string_view server{cdn.servers[i]};
    server = server.substr(0, server.find('?'));
    while (server.ends_with('/')) {
      server.remove_suffix(1);
    }
    if (server.empty()) {
      continue;
    }
    std::string url;
    if (!server.contains("://")) {
      url.assign(scheme);
    }
    url.append(server).append(suffix);
    urls.emplace_back(std::move(url));
  }
  return urls;
}

/// Fetch a table from the patch service.
///
/// @param [in] lib_ctx
///    Library context to use.
/// @param [in] product
///    Product code.
/// @param [in] name
///    Name of the table.
/// @param prim
///    Primary error code for returned errors.
/// @param [out] body
///    Variable that receives the table text on success.
/// @param [out] size
///    Variable that receives size of the table text on success.
/// @param [in] cancel_flag
///    Optional pointer to the cancellation flag.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err fetch_table(const tek_tc_lib_ctx &lib_ctx,
                       const char *_Nonnull product, std::string_view name,
                       tek_tc_errc prim, unique_buf &body, int &size,
                       const atomic_bool *_Nullable cancel_flag) {
  std::string url{lib_ctx.patch_url};
  url.push_back('/');
  url.append(product).push_back('/');
  url.append(name);
  return fetch_url(lib_ctx, url, prim, body, size, cancel_flag);
}

/// Fetch a data file by encoding key, decode it and verify that it matches
///    its content key.
///
/// @param [in, out] lib_ctx
///    Library context to use.
/// @param [in] cdn
///    CDN entry to fetch from.
/// @param [in] ekey
///    Encoding key of the file.
/// @param [in] ckey
///    Content key of the file.
/// @param prim
///    Primary error code for content mismatch errors.
/// @param [out] data
///    Variable that receives the decoded data on success.
/// @param [out] size
///    Variable that receives size of the decoded data on success.
/// @param [in] cancel_flag
///    Optional pointer to the cancellation flag.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err fetch_decoded(tek_tc_lib_ctx &lib_ctx, const tek_tc_cdn_entry &cdn,
                         const tek_tc_hash &ekey, const tek_tc_hash &ckey,
                         tek_tc_errc prim, unique_buf &data, int &size,
                         const atomic_bool *_Nullable cancel_flag) {
  void *encoded_ptr;
  int encoded_size;
  auto res{tek_tc_cdn_fetch(&lib_ctx, &cdn, false, &ekey, &encoded_ptr,
                            &encoded_size, cancel_flag)};
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  const unique_buf encoded{encoded_ptr, std::free};
  void *decoded_ptr;
  int decoded_size;
  res = tek_tc_blte_decode(encoded.get(), encoded_size, &decoded_ptr,
                           &decoded_size);
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  unique_buf decoded{decoded_ptr, std::free};
  tek_tc_hash md5;
  if (!ttci_u_md5(decoded.get(), decoded_size, &md5)) {
    return ttc_err_sub(prim, TEK_TC_ERRC_md5);
  }
  if (md5 != ckey) {
    return ttc_err_sub(prim, TEK_TC_ERRC_content_mismatch);
  }
  data = std::move(decoded);
  size = decoded_size;
  return ttc_err_ok();
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_err tek_tc_resolve_version(tek_tc_lib_ctx *lib_ctx, const char *product,
                                  const char *region,
                                  tek_tc_version_record *record,
                                  const atomic_bool *cancel_flag) {
  unique_buf text{nullptr, std::free};
  int size;
  const auto res{fetch_table(*lib_ctx, product, "versions",
                             TEK_TC_ERRC_fetch_versions, text, size,
                             cancel_flag)};
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  return tek_tc_versions_parse(reinterpret_cast<const char *>(text.get()),
                               size, product, region, record);
}

tek_tc_err tek_tc_resolve_cdn(tek_tc_lib_ctx *lib_ctx, const char *product,
                              const char *region, tek_tc_cdn_entry *entry,
                              const atomic_bool *cancel_flag) {
  unique_buf text{nullptr, std::free};
  int size;
  const auto res{fetch_table(*lib_ctx, product, "cdns",
                             TEK_TC_ERRC_fetch_cdns, text, size, cancel_flag)};
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  return tek_tc_cdns_parse(reinterpret_cast<const char *>(text.get()), size,
                           region, entry);
}

tek_tc_err tek_tc_cdn_fetch(tek_tc_lib_ctx *lib_ctx,
                            const tek_tc_cdn_entry *cdn, bool is_config,
                            const tek_tc_hash *key, void **data, int *size,
                            const atomic_bool *cancel_flag) {
  const auto prim{is_config ? TEK_TC_ERRC_fetch_config
                            : TEK_TC_ERRC_fetch_data};
  const auto urls{get_urls(*lib_ctx, *cdn, is_config, *key)};
  if (urls.empty()) {
    return ttc_err_sub(prim, TEK_TC_ERRC_malformed_response);
  }
  auto last_err{ttc_err_ok()};
  for (const auto &url : urls) {
    tek_tc_err_release(&last_err);
    unique_buf body{nullptr, std::free};
    int body_size;
    last_err = fetch_url(*lib_ctx, url, prim, body, body_size, cancel_flag);
    if (tek_tc_err_success(&last_err)) {
      *data = body.release();
      *size = body_size;
      return last_err;
    }
    if (last_err.type == TEK_TC_ERR_TYPE_sub &&
        last_err.auxiliary == TEK_TC_ERRC_cancelled) {
      break;
    }
  }
  return last_err;
}

tek_tc_err tek_tc_build_resolve(tek_tc_lib_ctx *lib_ctx, tek_tc_build *build,
                                const atomic_bool *cancel_flag) {
  // Select version record
  tek_tc_err res;
  if (build->versions_text) {
    res = tek_tc_versions_parse(build->versions_text,
                                build->versions_text_size, build->product,
                                build->region, &build->version);
  } else {
    res = tek_tc_resolve_version(lib_ctx, build->product, build->region,
                                 &build->version, cancel_flag);
  }
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  // Select CDN entry
  res = tek_tc_resolve_cdn(lib_ctx, build->product, build->region,
                           &build->cdn, cancel_flag);
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  // Get build configuration
  if (build->config_text) {
    res = tek_tc_bcfg_parse(build->config_text, build->config_text_size,
                            &build->config);
  } else {
    void *text_ptr;
    int text_size;
    res = tek_tc_cdn_fetch(lib_ctx, &build->cdn, true,
                           &build->version.build_config, &text_ptr, &text_size,
                           cancel_flag);
    if (tek_tc_err_success(&res)) {
      const unique_buf text{text_ptr, std::free};
      tek_tc_hash md5;
      if (!ttci_u_md5(text.get(), text_size, &md5)) {
        res = ttc_err_sub(TEK_TC_ERRC_fetch_config, TEK_TC_ERRC_md5);
      } else if (md5 != build->version.build_config) {
        res = ttc_err_sub(TEK_TC_ERRC_fetch_config,
                          TEK_TC_ERRC_content_mismatch);
      } else {
        res = tek_tc_bcfg_parse(reinterpret_cast<const char *>(text.get()),
                                text_size, &build->config);
      }
    }
  }
  if (!tek_tc_err_success(&res)) {
    tek_tc_cdn_release(&build->cdn);
  }
  return res;
}

tek_tc_err tek_tc_build_fetch_install(tek_tc_lib_ctx *lib_ctx,
                                      const tek_tc_build *build,
                                      tek_tc_install_manifest *manifest,
                                      const atomic_bool *cancel_flag) {
  auto ekey{build->config.install_ekey};
  if (!build->config.has_install_ekey) {
    tek_tc_encoding enc;
    auto res{tek_tc_build_fetch_encoding(lib_ctx, build, &enc, cancel_flag)};
    if (!tek_tc_err_success(&res)) {
      return res;
    }
    const bool found{
        tek_tc_enc_find(&enc, &build->config.install_ckey, &ekey)};
    tek_tc_enc_free(&enc);
    if (!found) {
      return ttc_err_sub(TEK_TC_ERRC_fetch_install,
                         TEK_TC_ERRC_ekey_not_found);
    }
  }
  unique_buf data{nullptr, std::free};
  int size;
  const auto res{fetch_decoded(*lib_ctx, build->cdn, ekey,
                               build->config.install_ckey,
                               TEK_TC_ERRC_fetch_install, data, size,
                               cancel_flag)};
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  return tek_tc_im_parse(data.get(), size, manifest);
}

tek_tc_err tek_tc_build_fetch_encoding(tek_tc_lib_ctx *lib_ctx,
                                       const tek_tc_build *build,
                                       tek_tc_encoding *enc,
                                       const atomic_bool *cancel_flag) {
  unique_buf data{nullptr, std::free};
  int size;
  auto res{fetch_decoded(*lib_ctx, build->cdn, build->config.encoding_ekey,
                         build->config.encoding_ckey,
                         TEK_TC_ERRC_fetch_encoding, data, size, cancel_flag)};
  if (!tek_tc_err_success(&res)) {
    return res;
  }
  res = tek_tc_enc_parse(data.get(), size, enc);
  if (tek_tc_err_success(&res)) {
    // The buffer is owned by enc now
    data.release();
  }
  return res;
}

tek_tc_err tek_tc_build_fetch_by_ckey(tek_tc_lib_ctx *lib_ctx,
                                      const tek_tc_build *build,
                                      const tek_tc_encoding *enc,
                                      const tek_tc_hash *ckey, void **data,
                                      int *size,
                                      const atomic_bool *cancel_flag) {
  tek_tc_encoding own_enc{};
  if (!enc) {
    const auto res{
        tek_tc_build_fetch_encoding(lib_ctx, build, &own_enc, cancel_flag)};
    if (!tek_tc_err_success(&res)) {
      return res;
    }
    enc = &own_enc;
  }
  tek_tc_hash ekey;
  const bool found{tek_tc_enc_find(enc, ckey, &ekey)};
  tek_tc_enc_free(&own_enc);
  if (!found) {
    return ttc_err_sub(TEK_TC_ERRC_fetch_data, TEK_TC_ERRC_ekey_not_found);
  }
  unique_buf buf{nullptr, std::free};
  const auto res{fetch_decoded(*lib_ctx, build->cdn, ekey, *ckey,
                               TEK_TC_ERRC_fetch_data, buf, *size,
                               cancel_flag)};
  if (tek_tc_err_success(&res)) {
    *data = buf.release();
  }
  return res;
}

void tek_tc_build_release(tek_tc_build *build) {
  tek_tc_cdn_release(&build->cdn);
  tek_tc_bcfg_release(&build->config);
}

} // extern "C"

} // namespace tek::tactclient::cdn
