//===-- error.h - error creation helpers ----------------------------------===//
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
/// Helper functions for creating @ref tek_tc_err objects.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-tactclient/error.h"

/// Create a basic @ref tek_tc_err for specified error code.
///
/// @param errc
///    Error code to create error object for.
/// @return A @ref tek_tc_err for specified error code.
[[gnu::nothrow, gnu::const]]
static inline tek_tc_err ttc_err_basic(tek_tc_errc errc) {
  return
#ifdef __cplusplus
      {.type = TEK_TC_ERR_TYPE_basic,
       .primary = errc,
       .auxiliary = 0,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (tek_tc_err){.type = TEK_TC_ERR_TYPE_basic, .primary = errc};
#endif // def __cplusplus else
}

/// Create a @ref tek_tc_err object indicating success.
/// @return A @ref tek_tc_err indicating success.
[[gnu::nothrow, gnu::const]]
static inline tek_tc_err ttc_err_ok(void) {
  return ttc_err_basic(TEK_TC_ERRC_ok);
}

/// Create a compound @ref tek_tc_err.
///
/// @param prim
///    Primary error code.
/// @param aux
///    Auxiliary error code.
/// @return A @ref tek_tc_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline tek_tc_err ttc_err_sub(tek_tc_errc prim, tek_tc_errc aux) {
  return
#ifdef __cplusplus
      {.type = TEK_TC_ERR_TYPE_sub,
       .primary = prim,
       .auxiliary = aux,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (tek_tc_err){
          .type = TEK_TC_ERR_TYPE_sub, .primary = prim, .auxiliary = aux};
#endif // def __cplusplus else
}

/// Create a BLTE chunk @ref tek_tc_err.
///
/// @param aux
///    Error code describing what's wrong with the chunk.
/// @param chunk_index
///    Index of the chunk in the container's chunk table.
/// @return A @ref tek_tc_err for specified chunk error.
[[gnu::nothrow, gnu::const]]
static inline tek_tc_err ttc_err_chunk(tek_tc_errc aux, int chunk_index) {
  return
#ifdef __cplusplus
      {.type = TEK_TC_ERR_TYPE_sub,
       .primary = TEK_TC_ERRC_blte_decode,
       .auxiliary = aux,
       .extra = chunk_index,
       .uri = nullptr};
#else  // def __cplusplus
      (tek_tc_err){.type = TEK_TC_ERR_TYPE_sub,
                   .primary = TEK_TC_ERRC_blte_decode,
                   .auxiliary = aux,
                   .extra = chunk_index};
#endif // def __cplusplus else
}
