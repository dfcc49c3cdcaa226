// Repository: rotaplay
// Component: Cache Scanner contract tests
// Purpose: Filename parsing and directory scans into the Library Store.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "rotaplay/library/CacheScanner.hpp"
#include "rotaplay/library/LibraryStore.hpp"

namespace rotaplay::tests::contracts {
namespace {

namespace fs = std::filesystem;

using library::CacheScanner;
using library::LibraryStore;
using library::ParseCachedFileName;

TEST(CacheFileNameContract, ParsesTitleArtistAndId) {
  const auto item = ParseCachedFileName("Never_Gonna_Rick_dQw4w9WgXcQ_normalized.mp4");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->id, "dQw4w9WgXcQ");
  EXPECT_EQ(item->title, "Never Gonna");
  EXPECT_EQ(item->artist, "Rick");
  EXPECT_FALSE(item->metadata_degraded);
}

TEST(CacheFileNameContract, IdMayContainUnderscore) {
  const auto item = ParseCachedFileName("Song_Band_ab_cdefghij_normalized.mp4");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->id, "ab_cdefghij");
  EXPECT_EQ(item->title, "Song");
  EXPECT_EQ(item->artist, "Band");
}

TEST(CacheFileNameContract, DegradedSuffixMarksMetadata) {
  const auto item = ParseCachedFileName("Song_Band_dQw4w9WgXcQ_normalized_gf.mp4");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->id, "dQw4w9WgXcQ");
  EXPECT_TRUE(item->metadata_degraded);
}

TEST(CacheFileNameContract, MissingMetadataFallsBackToUnknown) {
  const auto bare = ParseCachedFileName("dQw4w9WgXcQ_normalized.mp4");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->title, "Unknown Song");
  EXPECT_EQ(bare->artist, "Unknown Artist");

  const auto title_only = ParseCachedFileName("Song_dQw4w9WgXcQ_normalized.mp4");
  ASSERT_TRUE(title_only.has_value());
  EXPECT_EQ(title_only->title, "Song");
  EXPECT_EQ(title_only->artist, "Unknown Artist");
}

TEST(CacheFileNameContract, RejectsUnprocessedFiles) {
  EXPECT_FALSE(ParseCachedFileName("Song_Band_dQw4w9WgXcQ.mp4").has_value());
  EXPECT_FALSE(ParseCachedFileName("Song_Band_dQw4w9WgXcQ_normalized.webm").has_value());
  EXPECT_FALSE(ParseCachedFileName("Song_Band_short_normalized.mp4").has_value());
  EXPECT_FALSE(ParseCachedFileName("").has_value());
}

class CacheScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("rotaplay_cache_" + std::to_string(getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void WriteFile(const std::string& name, size_t bytes) {
    std::ofstream(dir_ / name) << std::string(bytes, 'x');
  }

  fs::path dir_;
  std::shared_ptr<LibraryStore> store_ = std::make_shared<LibraryStore>(16);
};

TEST_F(CacheScannerTest, ScanPutsValidFilesAndSkipsSmallOnes) {
  WriteFile("A_B_aaaaaaaaaaa_normalized.mp4", 64);
  WriteFile("C_D_bbbbbbbbbbb_normalized_gf.mp4", 64);
  WriteFile("E_F_ccccccccccc_normalized.mp4", 4);
  WriteFile("notes.txt", 64);

  CacheScanner scanner(store_, dir_.string(), 16);
  const auto report = scanner.ScanOnce();
  EXPECT_EQ(report.found, 2);
  EXPECT_EQ(report.degraded, 1);
  EXPECT_EQ(report.skipped_invalid, 1);
  EXPECT_EQ(report.removed, 0);

  ASSERT_TRUE(store_->Contains("aaaaaaaaaaa"));
  EXPECT_EQ(store_->Get("aaaaaaaaaaa")->local_path,
            (dir_ / "A_B_aaaaaaaaaaa_normalized.mp4").string());
  EXPECT_TRUE(store_->Contains("bbbbbbbbbbb"));
  EXPECT_FALSE(store_->Contains("ccccccccccc"));
}

TEST_F(CacheScannerTest, VanishedFilesAreRemovedOnRescan) {
  WriteFile("A_B_aaaaaaaaaaa_normalized.mp4", 64);
  WriteFile("C_D_bbbbbbbbbbb_normalized.mp4", 64);
  CacheScanner scanner(store_, dir_.string(), 16);
  scanner.ScanOnce();
  ASSERT_EQ(store_->Size(), 2u);

  fs::remove(dir_ / "C_D_bbbbbbbbbbb_normalized.mp4");
  const auto report = scanner.ScanOnce();
  EXPECT_EQ(report.removed, 1);
  EXPECT_EQ(store_->Ids(), (std::vector<std::string>{"aaaaaaaaaaa"}));
}

TEST_F(CacheScannerTest, RescanKeepsItemsItDidNotPut) {
  WriteFile("A_B_aaaaaaaaaaa_normalized.mp4", 64);
  library::LibraryItem external;
  external.id = "ext";
  external.local_path = "/srv/media/ext.mp4";
  external.title = "Remote";
  store_->Put(external);

  CacheScanner scanner(store_, dir_.string(), 16);
  scanner.ScanOnce();
  EXPECT_TRUE(store_->Contains("ext"));
  EXPECT_EQ(store_->TargetPlaylistIds().count("aaaaaaaaaaa"), 1u);

  fs::remove(dir_ / "A_B_aaaaaaaaaaa_normalized.mp4");
  const auto report = scanner.ScanOnce();
  EXPECT_EQ(report.removed, 1);
  EXPECT_FALSE(store_->Contains("aaaaaaaaaaa"));
  EXPECT_TRUE(store_->Contains("ext"));
  EXPECT_EQ(store_->TargetPlaylistIds().count("aaaaaaaaaaa"), 0u);
}

TEST_F(CacheScannerTest, MissingDirectoryIsReportedNotThrown) {
  CacheScanner scanner(store_, (dir_ / "absent").string(), 16);
  const auto report = scanner.ScanOnce();
  EXPECT_EQ(report.found, 0);
  EXPECT_TRUE(store_->Empty());
}

TEST_F(CacheScannerTest, BackgroundWorkerPicksUpNewFiles) {
  CacheScanner scanner(store_, dir_.string(), 16, 20);
  scanner.Start();
  WriteFile("A_B_aaaaaaaaaaa_normalized.mp4", 64);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!store_->Contains("aaaaaaaaaaa") &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  scanner.Stop();
  EXPECT_TRUE(store_->Contains("aaaaaaaaaaa"));
}

}  // namespace
}  // namespace rotaplay::tests::contracts
