// Repository: rotaplay
// Component: Playback Types
// Purpose: String conversions for PlaybackMode.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/PlaybackTypes.hpp"

#include <algorithm>
#include <cctype>

namespace rotaplay::runtime {

const char* ToString(PlaybackMode mode) {
  switch (mode) {
    case PlaybackMode::kContinuous:
      return "continuous";
    case PlaybackMode::kSingle:
      return "single";
    case PlaybackMode::kLoop:
      return "loop";
  }
  return "unknown";
}

std::optional<PlaybackMode> ParsePlaybackMode(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "continuous") return PlaybackMode::kContinuous;
  if (lower == "single") return PlaybackMode::kSingle;
  if (lower == "loop") return PlaybackMode::kLoop;
  return std::nullopt;
}

}  // namespace rotaplay::runtime
