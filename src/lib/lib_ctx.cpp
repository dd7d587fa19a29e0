//===-- lib_ctx.cpp - library context implementation ----------------------===//
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
/// Implementation of library context functions, version getter and product
///    name table.
///
//===----------------------------------------------------------------------===//
#include "lib_ctx.hpp"

#include "config.h"
#include "os.h"
#include "tek-tactclient/base.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <curl/curl.h>
#include <new>
#include <ranges>
#include <string_view>

namespace tek::tactclient {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Product name table entry.
struct product_entry {
  /// Friendly name of the product.
  const char *_Nonnull name;
  /// Product code used by the patch service.
  const char *_Nonnull code;
};

//===-- Private constants -------------------------------------------------===//

/// Default base URL of the patch service.
static constexpr std::string_view default_patch_url{
    "http://us.patch.battle.net:1119"};
/// Default timeout for each request, in milliseconds.
static constexpr long default_timeout_ms = 60000;
/// Default number of repetitions after a transport failure.
static constexpr int default_max_retries = 2;
/// Default delay before the first repetition, in milliseconds.
static constexpr long default_retry_backoff_ms = 500;
/// Upper bound of the default number of worker threads.
static constexpr int max_default_threads = 8;

/// Known products, in the order they're processed by default.
static constexpr std::array products{
    product_entry{"diablo3", "d3"},
    product_entry{"diablo3-ptr", "d3t"},
    product_entry{"diablo4", "fenris"},
    product_entry{"diablo4-beta", "fenrisb"},
    product_entry{"hearthstone", "hsb"},
    product_entry{"hearthstone-tournament", "hsc"},
    product_entry{"overwatch", "pro"},
    product_entry{"overwatch-test", "prot"},
    product_entry{"warcraft3", "w3"},
    product_entry{"wow", "wow"},
    product_entry{"wow-beta", "wow_beta"},
    product_entry{"wow-classic", "wow_classic"},
    product_entry{"wow-classic-beta", "wow_classic_beta"},
    product_entry{"wow-classic-ptr", "wow_classic_ptr"},
    product_entry{"wow-classic-era", "wow_classic_era"},
    product_entry{"wow-classic-era-beta", "wow_classic_era_beta"},
    product_entry{"wow-classic-era-ptr", "wow_classic_era_ptr"},
    product_entry{"wow-demo", "wowdemo"},
    product_entry{"wow-dev", "wowdev"},
    product_entry{"wow-dev2", "wowdev2"},
    product_entry{"wow-dev3", "wowdev3"},
    product_entry{"wow-e1", "wowe1"},
    product_entry{"wow-e3", "wowe3"},
    product_entry{"wow-live-test", "wowlivetest"},
    product_entry{"wow-live-test2", "wowlivetest2"},
    product_entry{"wow-t", "wowt"},
    product_entry{"wow-v", "wowv"},
    product_entry{"wow-v2", "wowv2"},
    product_entry{"wow-v3", "wowv3"},
    product_entry{"wow-v4", "wowv4"},
    product_entry{"wow-x-ptr", "wowxptr"},
    product_entry{"wow-z", "wowz"},
    product_entry{"call-of-duty-black-ops-cold-war", "zeus"}};

/// Friendly names of @ref products, for @ref tek_tc_product_names.
static constexpr auto product_names{[] {
  std::array<const char *, products.size()> res{};
  std::ranges::transform(products, res.begin(), &product_entry::name);
  return res;
}()};

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_lib_ctx *tek_tc_lib_init(const tek_tc_lib_cfg *cfg) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    return nullptr;
  }
  const auto ctx{new (std::nothrow) tek_tc_lib_ctx()};
  if (!ctx) {
    curl_global_cleanup();
    return nullptr;
  }
  ctx->patch_url = cfg && cfg->patch_url ? cfg->patch_url : default_patch_url;
  while (ctx->patch_url.ends_with('/')) {
    ctx->patch_url.pop_back();
  }
  ctx->timeout_ms =
      cfg && cfg->timeout_ms > 0 ? cfg->timeout_ms : default_timeout_ms;
  ctx->max_retries =
      cfg && cfg->max_retries >= 0 ? cfg->max_retries : default_max_retries;
  ctx->retry_backoff_ms = cfg && cfg->retry_backoff_ms > 0
                              ? cfg->retry_backoff_ms
                              : default_retry_backoff_ms;
  ctx->num_threads =
      cfg && cfg->num_threads > 0
          ? cfg->num_threads
          : std::min(ttci_os_get_nproc(), max_default_threads);
  ctx->use_http = cfg && cfg->use_http;
  ctx->transport = curl_transport;
  ctx->transport_data = nullptr;
  return ctx;
}

void tek_tc_lib_cleanup(tek_tc_lib_ctx *ctx) {
  delete ctx;
  curl_global_cleanup();
}

void tek_tc_lib_set_transport(tek_tc_lib_ctx *ctx, tek_tc_transport_func *func,
                              void *user_data) {
  if (func) {
    ctx->transport = func;
    ctx->transport_data = user_data;
  } else {
    ctx->transport = curl_transport;
    ctx->transport_data = nullptr;
  }
}

const char *tek_tc_version(void) { return TEK_TC_VERSION; }

const char *tek_tc_product_code(const char *name) {
  const std::string_view view{name};
  const auto lower{[](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }};
  const auto it{std::ranges::find_if(products, [view, &lower](auto &product) {
    return std::ranges::equal(view, std::string_view{product.name}, {}, lower);
  })};
  return it == products.end() ? nullptr : it->code;
}

const char *const *tek_tc_product_names(int *num_names) {
  *num_names = static_cast<int>(product_names.size());
  return product_names.data();
}

} // extern "C"

} // namespace tek::tactclient
