//===-- grab_test.cpp - bulk content retrieval tests ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-tactclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-tactclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "test_utils.hpp"

#include "tek-tactclient/base.h"
#include "tek-tactclient/cmap.h"
#include "tek-tactclient/error.h"
#include "tek-tactclient/grab.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <stdatomic.h>
#include <string>
#include <string_view>
#include <vector>

namespace tek::tactclient::test {
namespace {

constexpr std::string_view version{"1.0.0.54321"};
const std::vector<published_file> files{
    {.path = "Wow.exe", .content = "executable"},
    {.path = "Wow.pdb", .content = "program database"},
    {.path = "Utils\\Tool_loader.dll", .content = "loader"},
    {.path = "Data\\Extra.PDB", .content = "extra symbols"}};

class GrabTest : public ::testing::Test {
protected:
  void SetUp() override {
    lib_ctx.reset(make_lib_ctx());
    ASSERT_NE(lib_ctx.get(), nullptr);
    transport.install(lib_ctx.get());
    publish_product(transport, "wow", version, files);
  }

  void TearDown() override { tek_tc_grab_release(&desc); }

  /// Run grab for the specified products into the temporary directory.
  tek_tc_err run(std::vector<const char *> products = {"wow"},
                 const atomic_bool *cancel_flag = nullptr) {
    tek_tc_grab_release(&desc);
    names = std::move(products);
    desc.products = names.data();
    desc.num_products = static_cast<int>(names.size());
    desc.dest = dest_str.c_str();
    return tek_tc_grab(lib_ctx.get(), &desc, cancel_flag);
  }

  /// Find the outcome record of an item by its manifest path.
  const tek_tc_grab_item *_Nullable find_item(std::string_view path) const {
    if (desc.num_results < 1) {
      return nullptr;
    }
    const auto &prod{desc.results[0]};
    for (int i = 0; i < prod.num_items; ++i) {
      if (prod.items[i].path == path) {
        return &prod.items[i];
      }
    }
    return nullptr;
  }

  std::filesystem::path product_dir() const {
    return dest.path() / "wow" / std::string{version};
  }

  /// Get the path recorded in the CKey map of the destination for a key.
  std::string recorded_path(const tek_tc_hash &ckey) const {
    const std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap{
        tek_tc_cmap_load(dest_str.c_str(), nullptr), tek_tc_cmap_destroy};
    tek_tc_cmap_entry entry;
    if (!cmap || !tek_tc_cmap_lookup(cmap.get(), &ckey, &entry)) {
      return {};
    }
    std::string res{entry.path};
    tek_tc_cmap_entry_release(&entry);
    return res;
  }

  std::unique_ptr<tek_tc_lib_ctx, decltype(&tek_tc_lib_cleanup)> lib_ctx{
      nullptr, tek_tc_lib_cleanup};
  fake_transport transport;
  temp_dir dest;
  std::string dest_str{dest.str()};
  std::vector<const char *> names;
  tek_tc_grab_desc desc{};
};

/// Encoding key that the published copy of @p content is stored under.
tek_tc_hash published_ekey(std::string_view content) {
  return md5(blte_chunked({zlib_chunk(to_bytes(content))}));
}

TEST_F(GrabTest, WritesFilesMatchingDefaultPatterns) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(desc.num_results, 1);
  const auto &prod{desc.results[0]};
  EXPECT_STREQ(prod.name, "wow");
  EXPECT_STREQ(prod.code, "wow");
  EXPECT_EQ(std::string_view{prod.version}, version);
  EXPECT_TRUE(tek_tc_err_success(&prod.result));
  ASSERT_EQ(prod.num_items, 3);
  EXPECT_STREQ(prod.items[0].path, "Wow.pdb");
  EXPECT_STREQ(prod.items[1].path, "Utils\\Tool_loader.dll");
  EXPECT_STREQ(prod.items[2].path, "Data\\Extra.PDB");
  EXPECT_EQ(desc.num_written, 3);
  EXPECT_EQ(desc.num_skipped, 0);
  EXPECT_EQ(desc.num_failed, 0);
  for (int i = 0; i < prod.num_items; ++i) {
    EXPECT_EQ(prod.items[i].state, TEK_TC_GRAB_STATE_written) << i;
    EXPECT_FALSE(prod.items[i].renamed) << i;
  }
  EXPECT_EQ(read_file(product_dir() / "Wow.pdb"), "program database");
  EXPECT_EQ(read_file(product_dir() / "Utils" / "Tool_loader.dll"), "loader");
  EXPECT_EQ(read_file(product_dir() / "Data" / "Extra.PDB"), "extra symbols");
  EXPECT_FALSE(std::filesystem::exists(product_dir() / "Wow.exe"));
  EXPECT_STREQ(prod.items[1].dest_path,
               ("wow/" + std::string{version} + "/Utils/Tool_loader.dll")
                   .c_str());
}

TEST_F(GrabTest, RecordsWrittenFilesInCkeyMap) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap{
      tek_tc_cmap_load(dest_str.c_str(), nullptr), tek_tc_cmap_destroy};
  ASSERT_NE(cmap.get(), nullptr);
  EXPECT_EQ(tek_tc_cmap_size(cmap.get()), 3);
  const auto key{md5("program database")};
  tek_tc_cmap_entry entry;
  ASSERT_TRUE(tek_tc_cmap_lookup(cmap.get(), &key, &entry));
  EXPECT_EQ(std::string{entry.path},
            "wow/" + std::string{version} + "/Wow.pdb");
  EXPECT_STREQ(entry.product, "wow");
  EXPECT_EQ(std::string_view{entry.version}, version);
  tek_tc_cmap_entry_release(&entry);
}

TEST_F(GrabTest, UsesCustomPatterns) {
  const char *const patterns[]{R"(\.EXE$)"};
  desc.patterns = patterns;
  desc.num_patterns = 1;
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(desc.results[0].num_items, 1);
  EXPECT_STREQ(desc.results[0].items[0].path, "Wow.exe");
  EXPECT_EQ(read_file(product_dir() / "Wow.exe"), "executable");
}

TEST_F(GrabTest, SkipsRecordedFilesOnSecondRun) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto data_url{cdn_url("wow", false, published_ekey("loader"))};
  ASSERT_EQ(transport.count(data_url), 1);
  res = run();
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_written, 0);
  EXPECT_EQ(desc.num_skipped, 3);
  const auto item{find_item("Utils\\Tool_loader.dll")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_skipped);
  ASSERT_NE(item->dest_path, nullptr);
  EXPECT_EQ(std::string{item->dest_path},
            "wow/" + std::string{version} + "/Utils/Tool_loader.dll");
  EXPECT_EQ(transport.count(data_url), 1);
}

TEST_F(GrabTest, RefetchesRecordedFileThatIsGone) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  std::filesystem::remove(product_dir() / "Wow.pdb");
  res = run();
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_written, 1);
  EXPECT_EQ(desc.num_skipped, 2);
  EXPECT_EQ(read_file(product_dir() / "Wow.pdb"), "program database");
}

TEST_F(GrabTest, OverwriteRewritesRecordedFiles) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  desc.overwrite = true;
  res = run();
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_written, 3);
  EXPECT_EQ(desc.num_skipped, 0);
  const auto item{find_item("Wow.pdb")};
  ASSERT_NE(item, nullptr);
  EXPECT_FALSE(item->renamed);
  EXPECT_EQ(transport.count(
                cdn_url("wow", false, published_ekey("program database"))),
            2);
}

TEST_F(GrabTest, RenamesOnCollisionWithForeignFile) {
  write_file(product_dir() / "Wow.pdb", "something else");
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto item{find_item("Wow.pdb")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_written);
  EXPECT_TRUE(item->renamed);
  const auto renamed{"Wow." + hex(md5("program database")).substr(0, 8) +
                     ".pdb"};
  ASSERT_NE(item->dest_path, nullptr);
  EXPECT_EQ(std::string{item->dest_path},
            "wow/" + std::string{version} + '/' + renamed);
  EXPECT_EQ(read_file(product_dir() / "Wow.pdb"), "something else");
  EXPECT_EQ(read_file(product_dir() / renamed), "program database");
}

TEST_F(GrabTest, ReusesIdenticalUnrecordedFile) {
  write_file(product_dir() / "Wow.pdb", "program database");
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto item{find_item("Wow.pdb")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_written);
  EXPECT_FALSE(item->renamed);
  EXPECT_EQ(read_file(product_dir() / "Wow.pdb"), "program database");
}

TEST_F(GrabTest, KeepsBothKeysTargetingSamePath) {
  publish_product(transport, "wow", version,
                  {{.path = "Wow.pdb", .content = "first build"},
                   {.path = "Wow.pdb", .content = "second build"}});
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(desc.results[0].num_items, 2);
  const auto items{desc.results[0].items};
  const std::string contents[]{"first build", "second build"};
  int num_renamed{};
  for (int i = 0; i < 2; ++i) {
    const auto &item{items[i]};
    ASSERT_EQ(item.state, TEK_TC_GRAB_STATE_written) << i;
    ASSERT_NE(item.dest_path, nullptr) << i;
    num_renamed += item.renamed;
    EXPECT_EQ(read_file(dest.path() / item.dest_path), contents[i]) << i;
    EXPECT_EQ(recorded_path(item.ckey), item.dest_path) << i;
  }
  EXPECT_EQ(num_renamed, 1);
  EXPECT_STRNE(items[0].dest_path, items[1].dest_path);
}

TEST_F(GrabTest, RenamesWhenRecordedPathHoldsOtherKey) {
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  publish_product(transport, "wow", version,
                  {{.path = "Wow.pdb", .content = "patched database"}});
  res = run();
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto item{find_item("Wow.pdb")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_written);
  EXPECT_TRUE(item->renamed);
  const auto renamed{"Wow." + hex(md5("patched database")).substr(0, 8) +
                     ".pdb"};
  EXPECT_EQ(read_file(product_dir() / "Wow.pdb"), "program database");
  EXPECT_EQ(read_file(product_dir() / renamed), "patched database");
  const auto prefix{"wow/" + std::string{version} + '/'};
  EXPECT_EQ(recorded_path(md5("program database")), prefix + "Wow.pdb");
  EXPECT_EQ(recorded_path(md5("patched database")), prefix + renamed);
}

TEST_F(GrabTest, RollsBackCommitWhenMapCannotBeSaved) {
  // A single worker processes items in manifest order
  lib_ctx.reset(make_lib_ctx(1));
  ASSERT_NE(lib_ctx.get(), nullptr);
  transport.install(lib_ctx.get());
  // A stale record owns the loader path, its file is gone
  const auto stale_key{md5("old loader")};
  auto loader_path{"wow/" + std::string{version} +
                         "/Utils/Tool_loader.dll"};
  {
    const std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap{
        tek_tc_cmap_load(dest_str.c_str(), nullptr), tek_tc_cmap_destroy};
    ASSERT_NE(cmap.get(), nullptr);
    const tek_tc_cmap_entry entry{.path = loader_path.data(),
                                  .product = const_cast<char *>("wow"),
                                  .version = const_cast<char *>("0.9")};
    tek_tc_cmap_insert(cmap.get(), &stale_key, &entry);
    auto save_res{tek_tc_cmap_save(cmap.get())};
    ASSERT_TRUE(tek_tc_err_success(&save_res));
  }
  // Block the map's temporary file while the loader is being committed
  auto blocker{dest.path() / (std::string{TEK_TC_CMAP_FILE_NAME} + ".tmp")};
  desc.user_data = &blocker;
  desc.item_handler = [](tek_tc_grab_desc *grab_desc,
                         const tek_tc_grab_product *,
                         const tek_tc_grab_item *item) {
    const auto &path{
        *static_cast<const std::filesystem::path *>(grab_desc->user_data)};
    const std::string_view item_path{item->path};
    if (item_path == "Wow.pdb") {
      std::filesystem::create_directory(path);
    } else if (item_path == "Utils\\Tool_loader.dll") {
      std::filesystem::remove(path);
    }
  };
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_written, 2);
  EXPECT_EQ(desc.num_failed, 1);
  const auto item{find_item("Utils\\Tool_loader.dll")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_write_failed);
  EXPECT_EQ(item->result.primary, TEK_TC_ERRC_cmap_save);
  EXPECT_EQ(item->dest_path, nullptr);
  EXPECT_FALSE(std::filesystem::exists(blocker));
  EXPECT_FALSE(
      std::filesystem::exists(product_dir() / "Utils" / "Tool_loader.dll"));
  // The last commit saved the map with the failed one undone
  EXPECT_EQ(recorded_path(stale_key), loader_path);
  EXPECT_EQ(recorded_path(md5("loader")), "");
  EXPECT_EQ(recorded_path(md5("program database")),
            "wow/" + std::string{version} + "/Wow.pdb");
  EXPECT_EQ(recorded_path(md5("extra symbols")),
            "wow/" + std::string{version} + "/Data/Extra.PDB");
}

TEST_F(GrabTest, ReportsFetchFailure) {
  transport.set(cdn_url("wow", false, published_ekey("loader")), {}, 404);
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(desc.num_written, 2);
  EXPECT_EQ(desc.num_failed, 1);
  const auto item{find_item("Utils\\Tool_loader.dll")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_fetch_failed);
  EXPECT_FALSE(tek_tc_err_success(&item->result));
  EXPECT_EQ(item->dest_path, nullptr);
  EXPECT_FALSE(
      std::filesystem::exists(product_dir() / "Utils" / "Tool_loader.dll"));
}

TEST_F(GrabTest, RejectsContentWithWrongKey) {
  transport.set(cdn_url("wow", false, published_ekey("program database")),
                blte_chunked({zlib_chunk(to_bytes("tampered"))}));
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto item{find_item("Wow.pdb")};
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->state, TEK_TC_GRAB_STATE_decode_failed);
  EXPECT_EQ(item->result.primary, TEK_TC_ERRC_content_mismatch);
  EXPECT_FALSE(std::filesystem::exists(product_dir() / "Wow.pdb"));
  const std::unique_ptr<tek_tc_cmap, decltype(&tek_tc_cmap_destroy)> cmap{
      tek_tc_cmap_load(dest_str.c_str(), nullptr), tek_tc_cmap_destroy};
  const auto key{md5("program database")};
  EXPECT_FALSE(tek_tc_cmap_lookup(cmap.get(), &key, nullptr));
}

TEST_F(GrabTest, ReportsAllFailedWhenEveryItemFails) {
  for (const auto &file : files) {
    transport.set(cdn_url("wow", false, published_ekey(file.content)), {},
                  404);
  }
  auto res{run()};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_all_failed);
  EXPECT_EQ(desc.num_failed, 3);
  EXPECT_EQ(desc.num_written, 0);
}

TEST_F(GrabTest, RejectsPathsEscapingDestination) {
  publish_product(transport, "wow", version,
                  {{.path = "..\\..\\..\\evil.pdb", .content = "evil"},
                   {.path = "Good.pdb", .content = "good"}});
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  const auto evil{find_item("..\\..\\..\\evil.pdb")};
  ASSERT_NE(evil, nullptr);
  EXPECT_EQ(evil->state, TEK_TC_GRAB_STATE_write_failed);
  EXPECT_EQ(evil->result.primary, TEK_TC_ERRC_write_failed);
  EXPECT_FALSE(std::filesystem::exists(dest.path().parent_path() /
                                       "evil.pdb"));
  EXPECT_EQ(read_file(product_dir() / "Good.pdb"), "good");
}

TEST_F(GrabTest, ReportsUnknownProduct) {
  auto res{run({"wow", "starcraft9"})};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(desc.num_results, 2);
  EXPECT_TRUE(tek_tc_err_success(&desc.results[0].result));
  EXPECT_STREQ(desc.results[1].name, "starcraft9");
  EXPECT_EQ(desc.results[1].code, nullptr);
  EXPECT_EQ(desc.results[1].result.primary, TEK_TC_ERRC_unknown_product);
  EXPECT_EQ(desc.results[1].num_items, 0);
  res = run({"starcraft9"});
  EXPECT_EQ(res.primary, TEK_TC_ERRC_all_failed);
}

TEST_F(GrabTest, ReportsUnresolvableProduct) {
  // Product code is known, but nothing is published for it
  auto res{run({"wow", "diablo4"})};
  ASSERT_TRUE(tek_tc_err_success(&res));
  ASSERT_EQ(desc.num_results, 2);
  EXPECT_STREQ(desc.results[1].code, "fenris");
  EXPECT_FALSE(tek_tc_err_success(&desc.results[1].result));
  EXPECT_EQ(desc.results[1].version[0], '\0');
  EXPECT_EQ(desc.num_written, 3);
}

TEST_F(GrabTest, RejectsInvalidPattern) {
  const char *const patterns[]{"(unclosed"};
  desc.patterns = patterns;
  desc.num_patterns = 1;
  auto res{run()};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_invalid_pattern);
  EXPECT_EQ(desc.results, nullptr);
  EXPECT_TRUE(transport.log().empty());
}

TEST_F(GrabTest, StopsWhenCancelled) {
  const atomic_bool cancel{true};
  auto res{run({"wow"}, &cancel)};
  EXPECT_EQ(res.primary, TEK_TC_ERRC_cancelled);
  ASSERT_EQ(desc.num_results, 1);
  EXPECT_EQ(desc.results[0].result.primary, TEK_TC_ERRC_cancelled);
  EXPECT_EQ(desc.num_written, 0);
  EXPECT_TRUE(transport.log().empty());
}

struct handler_log {
  int num_products;
  int num_written;
  int num_other;
};

TEST_F(GrabTest, CallsHandlers) {
  handler_log log{};
  desc.user_data = &log;
  desc.product_handler = [](tek_tc_grab_desc *grab_desc,
                            const tek_tc_grab_product *) {
    ++static_cast<handler_log *>(grab_desc->user_data)->num_products;
  };
  desc.item_handler = [](tek_tc_grab_desc *grab_desc,
                         const tek_tc_grab_product *,
                         const tek_tc_grab_item *item) {
    auto &log{*static_cast<handler_log *>(grab_desc->user_data)};
    if (item->state == TEK_TC_GRAB_STATE_written) {
      ++log.num_written;
    } else {
      ++log.num_other;
    }
  };
  auto res{run()};
  ASSERT_TRUE(tek_tc_err_success(&res));
  EXPECT_EQ(log.num_products, 1);
  EXPECT_EQ(log.num_written, 3);
  EXPECT_EQ(log.num_other, 0);
}

TEST(GrabReleaseTest, ResetsDescriptor) {
  tek_tc_grab_desc desc{};
  tek_tc_grab_release(&desc);
  EXPECT_EQ(desc.results, nullptr);
  EXPECT_EQ(desc.num_results, 0);
}

} // namespace
} // namespace tek::tactclient::test
