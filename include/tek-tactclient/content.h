//===-- content.h - TACT content formats API ------------------------------===//
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
/// Declarations of types and functions for decoding TACT content formats:
///    BLTE containers, install manifests, encoding manifests and build
///    configurations.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"

#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// BLTE chunk encoding modes, identified by the first byte of chunk data.
enum tek_tc_blte_mode {
  /// Plain data.
  TEK_TC_BLTE_MODE_none = 'N',
  /// zlib-compressed data.
  TEK_TC_BLTE_MODE_zlib = 'Z',
  /// Nested BLTE container.
  TEK_TC_BLTE_MODE_frame = 'F',
  /// Nested BLTE container, alternative mode byte.
  TEK_TC_BLTE_MODE_recursive = 'B',
  /// Encrypted data.
  TEK_TC_BLTE_MODE_encrypted = 'E'
};
/// @copydoc tek_tc_blte_mode
typedef enum tek_tc_blte_mode tek_tc_blte_mode;

/// Install manifest tag, a named attribute used for platform, architecture
///    and locale filtering.
typedef struct tek_tc_im_tag tek_tc_im_tag;
/// @copydoc tek_tc_im_tag
struct tek_tc_im_tag {
  /// Name of the tag, as a null-terminated string.
  const char *_Nonnull name;
  /// Type (category) of the tag.
  int type;
};

/// Install manifest file entry.
typedef struct tek_tc_im_entry tek_tc_im_entry;
/// @copydoc tek_tc_im_entry
struct tek_tc_im_entry {
  /// Relative path of the file, as a null-terminated string. Directory
  ///    separators may be either forward or backward slashes.
  const char *_Nonnull path;
  /// Content key of the file.
  tek_tc_hash ckey;
  /// Encoding key of the file, valid only if @ref has_ekey is `true`.
  ///    Install manifests don't carry encoding keys, they are filled from an
  ///    encoding manifest by consumers that need them.
  tek_tc_hash ekey;
  /// Value indicating whether @ref ekey is set.
  bool has_ekey;
  /// Size of the file, in bytes.
  uint32_t size;
  /// Install flags of the entry: bitset of manifest tags that the entry
  ///    belongs to, bit `i` (`tags[i / 8] & (0x80 >> (i % 8))`) corresponds to
  ///    the manifest's tag `i`.
  const unsigned char *_Nonnull tags;
};

/// Parsed install manifest.
typedef struct tek_tc_install_manifest tek_tc_install_manifest;
/// @copydoc tek_tc_install_manifest
struct tek_tc_install_manifest {
  /// Pointer to the buffer holding all manifest data, that other pointers
  ///    point into.
  void *_Nullable buf;
  /// Format version of the manifest.
  int version;
  /// Number of entries pointed to by @ref tags.
  int num_tags;
  /// Number of entries pointed to by @ref entries.
  int num_entries;
  /// Pointer to the array of tags.
  tek_tc_im_tag *_Nullable tags;
  /// Pointer to the array of file entries, in their on-disk order. Paths may
  ///    repeat, later entries shadow earlier ones.
  tek_tc_im_entry *_Nullable entries;
};

/// Parsed encoding manifest. The decoded manifest data is kept and searched
///    in place.
typedef struct tek_tc_encoding tek_tc_encoding;
/// @copydoc tek_tc_encoding
struct tek_tc_encoding {
  /// Pointer to the buffer containing decoded encoding manifest data.
  void *_Nullable buf;
  /// Size of the buffer pointed to by @ref buf, in bytes.
  int size;
  /// Number of content key pages.
  int num_pages;
  /// Size of each content key page, in bytes.
  int page_size;
  /// Pointer to the page index, an array of @ref num_pages `{first key,
  ///    page MD5}` pairs.
  const unsigned char *_Nullable page_index;
  /// Pointer to the first content key page.
  const unsigned char *_Nullable pages;
};

/// Build configuration fields needed to locate manifests.
typedef struct tek_tc_build_config tek_tc_build_config;
/// @copydoc tek_tc_build_config
struct tek_tc_build_config {
  /// Content key of the root file.
  tek_tc_hash root;
  /// Content key of the install manifest.
  tek_tc_hash install_ckey;
  /// Encoding key of the install manifest, valid only if
  ///    @ref has_install_ekey is `true`.
  tek_tc_hash install_ekey;
  /// Value indicating whether @ref install_ekey is set.
  bool has_install_ekey;
  /// Content key of the encoding manifest.
  tek_tc_hash encoding_ckey;
  /// Encoding key of the encoding manifest.
  tek_tc_hash encoding_ekey;
  /// Size of the decoded install manifest, in bytes, or `0` if not specified.
  uint64_t install_size;
  /// Size of the decoded encoding manifest, in bytes, or `0` if not
  ///    specified.
  uint64_t encoding_size;
  /// Build name, as a heap-allocated null-terminated string, or `nullptr` if
  ///    not specified.
  char *_Nullable build_name;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===--- BLTE -------------------------------------------------------------===//

/// Decode a BLTE container, verifying checksums of all chunks.
///
/// @param [in] data
///    Pointer to the container data.
/// @param size
///    Size of the container data, in bytes.
/// @param [out] out
///    Address of variable that receives pointer to the decoded data on
///    success. It must be freed with `free` after use. No output is produced
///    on failure.
/// @param [out] out_size
///    Address of variable that receives size of the decoded data on success,
///    in bytes.
/// @return A @ref tek_tc_err indicating the result of operation. Chunk-level
///    errors have @ref TEK_TC_ERRC_blte_decode primary code and `extra` set
///    to the index of the failed chunk.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3, 4), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3), gnu::access(write_only, 4)]]
tek_tc_err tek_tc_blte_decode(const void *_Nonnull data, int size,
                              void *_Nullable *_Nonnull out,
                              int *_Nonnull out_size);

//===--- Install manifest -------------------------------------------------===//

/// Parse an install manifest.
///
/// @param [in] data
///    Pointer to the decoded install manifest data.
/// @param size
///    Size of the manifest data, in bytes.
/// @param [out] manifest
///    Address of variable that receives the parsed manifest on success. It
///    must be freed with @ref tek_tc_im_free after use.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
tek_tc_err tek_tc_im_parse(const void *_Nonnull data, int size,
                           tek_tc_install_manifest *_Nonnull manifest);

/// Check whether an install manifest entry has a tag with specified name.
///
/// @param [in] manifest
///    Pointer to the manifest that owns @p entry.
/// @param [in] entry
///    Pointer to the entry to check.
/// @param [in] tag_name
///    Name of the tag to check, as a null-terminated string.
/// @return Value indicating whether @p entry has the tag.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::null_terminated_string_arg(3)]]
bool tek_tc_im_entry_has_tag(const tek_tc_install_manifest *_Nonnull manifest,
                             const tek_tc_im_entry *_Nonnull entry,
                             const char *_Nonnull tag_name);

/// Free all memory allocated for an install manifest.
///
/// @param [in, out] manifest
///    Pointer to the manifest to free.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_im_free(tek_tc_install_manifest *_Nonnull manifest);

//===--- Encoding manifest ------------------------------------------------===//

/// Parse an encoding manifest, verifying checksums of all content key pages.
///
/// @param [in] data
///    Pointer to the decoded encoding manifest data. It must have been
///    allocated with `malloc`. On success, ownership of the buffer is
///    transferred to @p enc, otherwise it stays with the caller.
/// @param size
///    Size of the manifest data, in bytes.
/// @param [out] enc
///    Address of variable that receives the parsed manifest on success. It
///    must be freed with @ref tek_tc_enc_free after use.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
tek_tc_err tek_tc_enc_parse(void *_Nonnull data, int size,
                            tek_tc_encoding *_Nonnull enc);

/// Find the encoding key for a content key.
///
/// @param [in] enc
///    Pointer to the encoding manifest to search.
/// @param [in] ckey
///    Pointer to the content key to find.
/// @param [out] ekey
///    Address of variable that receives the first encoding key of the content
///    on success.
/// @return Value indicating whether the content key was found.
[[gnu::TEK_TC_API, gnu::nonnull(1, 2, 3), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3)]]
bool tek_tc_enc_find(const tek_tc_encoding *_Nonnull enc,
                     const tek_tc_hash *_Nonnull ckey,
                     tek_tc_hash *_Nonnull ekey);

/// Free all memory allocated for an encoding manifest.
///
/// @param [in, out] enc
///    Pointer to the encoding manifest to free.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_enc_free(tek_tc_encoding *_Nonnull enc);

//===--- Build configuration ----------------------------------------------===//

/// Parse a build configuration file.
///
/// @param [in] data
///    Pointer to the build configuration text.
/// @param size
///    Size of the text, in bytes.
/// @param [out] config
///    Address of variable that receives parsed configuration on success. It
///    must be released with @ref tek_tc_bcfg_release after use.
/// @return A @ref tek_tc_err indicating the result of operation.
[[gnu::TEK_TC_API, gnu::nonnull(1, 3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
tek_tc_err tek_tc_bcfg_parse(const char *_Nonnull data, int size,
                             tek_tc_build_config *_Nonnull config);

/// Release memory allocated for a build configuration.
///
/// @param [in, out] config
///    Pointer to the configuration to release.
[[gnu::TEK_TC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_tc_bcfg_release(tek_tc_build_config *_Nonnull config);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
