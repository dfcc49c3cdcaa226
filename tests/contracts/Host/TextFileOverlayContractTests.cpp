// Repository: rotaplay
// Component: Text File Overlay contract tests
// Purpose: Title text and opacity published as files.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "rotaplay/media/TextFileOverlay.hpp"

namespace rotaplay::tests::contracts {
namespace {

namespace fs = std::filesystem;

using media::TextFileOverlay;

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

class TextFileOverlayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("rotaplay_overlay_" + std::to_string(getpid()));
    fs::remove_all(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }
  fs::path dir_;
};

TEST_F(TextFileOverlayTest, CreatesParentDirectoryAndWritesText) {
  TextFileOverlay overlay((dir_ / "out" / "now_playing.txt").string());
  EXPECT_TRUE(overlay.IsAvailable());

  ASSERT_TRUE(overlay.SetText("Song - Band"));
  EXPECT_EQ(ReadAll(overlay.text_path()), "Song - Band");
  EXPECT_FALSE(fs::exists(overlay.text_path() + ".tmp"));

  ASSERT_TRUE(overlay.SetText(""));
  EXPECT_EQ(ReadAll(overlay.text_path()), "");
}

TEST_F(TextFileOverlayTest, OpacityIsClampedAndWrittenBesideText) {
  TextFileOverlay overlay((dir_ / "now_playing.txt").string());
  overlay.SetOpacity(55);
  EXPECT_EQ(ReadAll(overlay.opacity_path()), "55\n");

  overlay.SetOpacity(250);
  EXPECT_EQ(ReadAll(overlay.opacity_path()), "100\n");

  overlay.SetOpacity(-3);
  EXPECT_EQ(ReadAll(overlay.opacity_path()), "0\n");
}

TEST_F(TextFileOverlayTest, UnavailableWhenDirectoryDisappears) {
  TextFileOverlay overlay((dir_ / "gone" / "now_playing.txt").string());
  ASSERT_TRUE(overlay.IsAvailable());

  fs::remove_all(dir_ / "gone");
  EXPECT_FALSE(overlay.IsAvailable());
  EXPECT_FALSE(overlay.SetText("Song"));
}

}  // namespace
}  // namespace rotaplay::tests::contracts
