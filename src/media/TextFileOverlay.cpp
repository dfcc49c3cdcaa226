// Repository: rotaplay
// Component: Text File Overlay
// Purpose: Publishes title text and opacity as files.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/media/TextFileOverlay.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "rotaplay/util/Logger.hpp"

namespace rotaplay::media {

using rotaplay::util::Logger;

namespace {

bool WriteAtomically(const std::string& path, const std::string& content) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) return false;
    out << content;
    out.flush();
    if (!out) return false;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

}  // namespace

TextFileOverlay::TextFileOverlay(std::string text_path)
    : text_path_(std::move(text_path)) {
  const auto parent = std::filesystem::path(text_path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      Logger::Warn("[TextFileOverlay] Cannot create " + parent.string() + ": " +
                   ec.message());
    }
  }
}

bool TextFileOverlay::IsAvailable() const {
  auto parent = std::filesystem::path(text_path_).parent_path();
  if (parent.empty()) parent = ".";
  std::error_code ec;
  return std::filesystem::is_directory(parent, ec);
}

bool TextFileOverlay::SetText(const std::string& text) {
  if (!WriteAtomically(text_path_, text)) {
    Logger::Error("[TextFileOverlay] Failed to write " + text_path_);
    return false;
  }
  return true;
}

void TextFileOverlay::SetOpacity(int percent) {
  percent = std::clamp(percent, 0, 100);
  if (percent == last_opacity_) return;
  if (!WriteAtomically(opacity_path(), std::to_string(percent) + "\n")) {
    Logger::Error("[TextFileOverlay] Failed to write " + opacity_path());
    return;
  }
  last_opacity_ = percent;
}

}  // namespace rotaplay::media
