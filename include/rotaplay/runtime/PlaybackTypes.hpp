// Repository: rotaplay
// Component: Playback Types
// Purpose: Playback mode enum shared by the controller, selector and control surface.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_PLAYBACK_TYPES_HPP_
#define ROTAPLAY_RUNTIME_PLAYBACK_TYPES_HPP_

#include <optional>
#include <string>

namespace rotaplay::runtime {

enum class PlaybackMode {
  kContinuous,  // Random rotation, no repeat until the library is exhausted.
  kSingle,      // Play one item, then stop.
  kLoop,        // Repeat one pinned item.
};

const char* ToString(PlaybackMode mode);

// Accepts "continuous", "single", "loop" (case-insensitive).
std::optional<PlaybackMode> ParsePlaybackMode(const std::string& text);

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_PLAYBACK_TYPES_HPP_
