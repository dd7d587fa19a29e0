//===-- cmap.cpp - CKey map implementation --------------------------------===//
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
/// Implementation of CKey map functions.
///
/// The map file is a JSON object keyed by lowercase hexadecimal content keys,
///    each value being an object with `filename`, `product` and `version`
///    string fields. Keys are written in sorted order with 2-space
///    indentation.
///
//===----------------------------------------------------------------------===//
#include "cmap.hpp"

#include "common/error.h"
#include "content_ops.hpp"
#include "os.h"
#include "tek-tactclient/base.h"
#include "tek-tactclient/cmap.h"
#include "tek-tactclient/error.h"
#include "utils.h"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <optional>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace tek::tactclient::cmap {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get path to the map file of a map instance.
std::string get_file_path(const tek_tc_cmap &cmap) {
  std::string res{cmap.dir};
  res.append(TTCI_OS_PATH_SEP_CHAR_STR TEK_TC_CMAP_FILE_NAME);
  return res;
}

/// Create a heap-allocated copy of a string.
///
/// @param str
///    String to copy.
/// @return Pointer to the copy, or `nullptr` if allocation fails.
char *_Nullable dup_str(std::string_view str) {
  const auto res{reinterpret_cast<char *>(std::malloc(str.length() + 1))};
  if (res) {
    std::memcpy(res, str.data(), str.length());
    res[str.length()] = '\0';
  }
  return res;
}

/// Get a string member of a JSON object.
///
/// @param [in] obj
///    JSON object to get the member from.
/// @param [in] name
///    Name of the member.
/// @param [out] str
///    Variable that receives the member value.
/// @return Value indicating whether the member exists and is a string.
bool get_str_member(const rapidjson::Value &obj, const char *_Nonnull name,
                    std::string &str) {
  const auto member{obj.FindMember(name)};
  if (member == obj.MemberEnd() || !member->value.IsString()) {
    return false;
  }
  str.assign(member->value.GetString(), member->value.GetStringLength());
  return true;
}

/// Read the whole map file.
///
/// @param [in] path
///    Path to the map file.
/// @param [out] buf
///    Variable that receives the file contents.
/// @return A @ref tek_tc_err indicating the result of operation.
tek_tc_err read_file(const std::string &path, std::string &buf) {
  const auto handle{ttci_os_file_open(path.c_str())};
  if (handle == TTCI_OS_INVALID_HANDLE) {
    return ttci_os_io_err(path.c_str(), TEK_TC_ERRC_cmap_load,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  auto res{ttc_err_ok()};
  if (const auto size{ttci_os_file_get_size(handle)}; size == SIZE_MAX) {
    res = ttci_os_io_err(path.c_str(), TEK_TC_ERRC_cmap_load,
                         ttci_os_get_last_error(),
                         TEK_TC_ERR_IO_TYPE_get_size);
  } else {
    buf.resize(size);
    if (!ttci_os_file_read(handle, buf.data(), size)) {
      res = ttci_os_io_err(path.c_str(), TEK_TC_ERRC_cmap_load,
                           ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_read);
    }
  }
  ttci_os_close_handle(handle);
  return res;
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

const record *find(const tek_tc_cmap &cmap, const tek_tc_hash &ckey) {
  const auto it{cmap.records.find(ckey)};
  return it == cmap.records.end() ? nullptr : &it->second;
}

std::optional<tek_tc_hash> find_path(const tek_tc_cmap &cmap,
                                     const std::string &path) {
  const auto it{cmap.paths.find(path)};
  if (it == cmap.paths.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool insert(tek_tc_cmap &cmap, const tek_tc_hash &ckey, record rec) {
  // Drop whatever else points at the path
  if (const auto it{cmap.paths.find(rec.path)};
      it != cmap.paths.end() && it->second != ckey) {
    cmap.records.erase(it->second);
    cmap.paths.erase(it);
  }
  const auto it{cmap.records.find(ckey)};
  if (it == cmap.records.end()) {
    cmap.paths.insert_or_assign(rec.path, ckey);
    cmap.records.emplace(ckey, std::move(rec));
    return false;
  }
  if (it->second.path != rec.path) {
    cmap.paths.erase(it->second.path);
    cmap.paths.insert_or_assign(rec.path, ckey);
  }
  it->second = std::move(rec);
  return true;
}

bool remove(tek_tc_cmap &cmap, const tek_tc_hash &ckey) {
  const auto it{cmap.records.find(ckey)};
  if (it == cmap.records.end()) {
    return false;
  }
  cmap.paths.erase(it->second.path);
  cmap.records.erase(it);
  return true;
}

tek_tc_err save(const tek_tc_cmap &cmap) {
  if (!ttci_os_dir_create(cmap.dir.c_str())) {
    return ttci_os_io_err(cmap.dir.c_str(), TEK_TC_ERRC_cmap_save,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  // Serialize the map
  rapidjson::StringBuffer buf;
  rapidjson::PrettyWriter writer(buf);
  writer.SetIndent(' ', 2);
  writer.StartObject();
  for (const auto &[ckey, rec] : cmap.records) {
    const auto key{to_string(ckey)};
    writer.Key(key.data(), key.length());
    writer.StartObject();
    std::string_view str{"filename"};
    writer.Key(str.data(), str.length());
    writer.String(rec.path.data(), rec.path.length());
    str = "product";
    writer.Key(str.data(), str.length());
    writer.String(rec.product.data(), rec.product.length());
    str = "version";
    writer.Key(str.data(), str.length());
    writer.String(rec.version.data(), rec.version.length());
    writer.EndObject();
  }
  writer.EndObject();
  // Write it to a temporary file and replace the map file with it
  const auto path{get_file_path(cmap)};
  const auto tmp_path{path + ".tmp"};
  const auto handle{ttci_os_file_create(tmp_path.c_str())};
  if (handle == TTCI_OS_INVALID_HANDLE) {
    return ttci_os_io_err(tmp_path.c_str(), TEK_TC_ERRC_cmap_save,
                          ttci_os_get_last_error(), TEK_TC_ERR_IO_TYPE_open);
  }
  const bool written{
      ttci_os_file_write(handle, buf.GetString(), buf.GetSize())};
  const auto write_errc{ttci_os_get_last_error()};
  ttci_os_close_handle(handle);
  if (!written) {
    ttci_os_file_delete(tmp_path.c_str());
    return ttci_os_io_err(tmp_path.c_str(), TEK_TC_ERRC_cmap_save, write_errc,
                          TEK_TC_ERR_IO_TYPE_write);
  }
  if (!ttci_os_file_move(tmp_path.c_str(), path.c_str())) {
    const auto errc{ttci_os_get_last_error()};
    ttci_os_file_delete(tmp_path.c_str());
    return ttci_os_io_err(path.c_str(), TEK_TC_ERRC_cmap_save, errc,
                          TEK_TC_ERR_IO_TYPE_move);
  }
  return ttc_err_ok();
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_tc_cmap *tek_tc_cmap_load(const char *dir, tek_tc_err *warning) {
  if (warning) {
    *warning = ttc_err_ok();
  }
  const auto cmap{new (std::nothrow) tek_tc_cmap()};
  if (!cmap) {
    return nullptr;
  }
  cmap->dir = dir;
  while (cmap->dir.length() > 1 && cmap->dir.ends_with('/')) {
    cmap->dir.pop_back();
  }
  // Read the file
  const auto path{get_file_path(*cmap)};
  if (ttci_os_path_exists(path.c_str()) == TTCI_OS_ERR_FILE_NOT_FOUND) {
    return cmap;
  }
  std::string buf;
  if (auto res{read_file(path, buf)}; !tek_tc_err_success(&res)) {
    if (warning) {
      *warning = res;
    } else {
      tek_tc_err_release(&res);
    }
    return cmap;
  }
  // Parse it
  rapidjson::Document doc;
  doc.ParseInsitu<rapidjson::kParseStopWhenDoneFlag>(buf.data());
  if (doc.HasParseError() || !doc.IsObject()) {
    if (warning) {
      *warning = ttc_err_basic(TEK_TC_ERRC_cmap_corrupt);
    }
    return cmap;
  }
  bool dropped{};
  for (const auto &member : doc.GetObject()) {
    tek_tc_hash ckey;
    if (member.name.GetStringLength() != 32 ||
        !ttci_u_str_to_hash(member.name.GetString(), &ckey) ||
        !member.value.IsObject()) {
      dropped = true;
      continue;
    }
    record rec;
    if (!get_str_member(member.value, "filename", rec.path) ||
        rec.path.empty()) {
      dropped = true;
      continue;
    }
    rec.path = normalize_path(rec.path);
    get_str_member(member.value, "product", rec.product);
    get_str_member(member.value, "version", rec.version);
    insert(*cmap, ckey, std::move(rec));
  }
  if (dropped && warning) {
    *warning = ttc_err_basic(TEK_TC_ERRC_cmap_corrupt);
  }
  return cmap;
}

void tek_tc_cmap_destroy(tek_tc_cmap *cmap) { delete cmap; }

int tek_tc_cmap_size(tek_tc_cmap *cmap) {
  const std::shared_lock lock{cmap->mtx};
  return static_cast<int>(cmap->records.size());
}

bool tek_tc_cmap_lookup(tek_tc_cmap *cmap, const tek_tc_hash *ckey,
                        tek_tc_cmap_entry *entry) {
  const std::shared_lock lock{cmap->mtx};
  const auto rec{find(*cmap, *ckey)};
  if (!rec) {
    return false;
  }
  if (entry) {
    *entry = {.path = dup_str(rec->path),
              .product = dup_str(rec->product),
              .version = dup_str(rec->version)};
  }
  return true;
}

bool tek_tc_cmap_find_path(tek_tc_cmap *cmap, const char *path,
                           tek_tc_hash *ckey) {
  const auto norm_path{normalize_path(path)};
  const std::shared_lock lock{cmap->mtx};
  const auto res{find_path(*cmap, norm_path)};
  if (!res) {
    return false;
  }
  *ckey = *res;
  return true;
}

bool tek_tc_cmap_insert(tek_tc_cmap *cmap, const tek_tc_hash *ckey,
                        const tek_tc_cmap_entry *entry) {
  record rec{.path = normalize_path(entry->path ? entry->path : ""),
             .product = entry->product ? entry->product : "",
             .version = entry->version ? entry->version : ""};
  const std::unique_lock lock{cmap->mtx};
  return insert(*cmap, *ckey, std::move(rec));
}

bool tek_tc_cmap_remove(tek_tc_cmap *cmap, const tek_tc_hash *ckey) {
  const std::unique_lock lock{cmap->mtx};
  return remove(*cmap, *ckey);
}

tek_tc_err tek_tc_cmap_save(tek_tc_cmap *cmap) {
  // Exclusive, as concurrent saves would share the temporary file
  const std::unique_lock lock{cmap->mtx};
  return save(*cmap);
}

void tek_tc_cmap_entry_release(tek_tc_cmap_entry *entry) {
  std::free(entry->path);
  std::free(entry->product);
  std::free(entry->version);
  *entry = {};
}

} // extern "C"

} // namespace tek::tactclient::cmap
