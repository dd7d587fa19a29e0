//===-- zlib_api.h - zlib adapter API -------------------------------------===//
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
/// Type definitions and macros that are resolved to zlib or zlib-ng based on
///    the build option.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h" // IWYU pragma: keep

#ifdef TEK_TCB_ZNG
#include <zlib-ng.h>

typedef zng_stream ttci_z_stream;
#define ttci_z_inflate zng_inflate
#define ttci_z_inflateEnd zng_inflateEnd
#define ttci_z_inflateInit zng_inflateInit

#else // def TEK_TCB_ZNG
#include <zlib.h>

typedef z_stream ttci_z_stream;
#define ttci_z_inflate inflate
#define ttci_z_inflateEnd inflateEnd
#define ttci_z_inflateInit inflateInit

#endif // def TEK_TCB_ZNG else
