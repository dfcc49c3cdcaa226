// Repository: rotaplay
// Component: Status Snapshot
// Purpose: Copyable view of controller state published for other threads.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_STATUS_SNAPSHOT_HPP_
#define ROTAPLAY_RUNTIME_STATUS_SNAPSHOT_HPP_

#include <cstdint>
#include <mutex>
#include <string>

#include "rotaplay/media/IMediaSource.hpp"
#include "rotaplay/runtime/PlaybackTypes.hpp"

namespace rotaplay::runtime {

struct StatusSnapshot {
  PlaybackMode mode = PlaybackMode::kContinuous;
  bool scene_visible = true;
  bool is_playing = false;
  media::MediaStatus host_status = media::MediaStatus::kNone;
  std::string current_item_id;
  std::string display_text;
  std::string loop_item_id;
  int64_t position_ms = 0;
  int64_t duration_ms = 0;
  uint32_t library_size = 0;
  uint32_t played_count = 0;
  int retry_count = 0;
  bool first_item_played = false;
  bool shutdown_requested = false;
  int overlay_opacity = 0;
};

// Latest snapshot, written by the tick loop and read by the control service.
class StatusBoard {
 public:
  void Publish(const StatusSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = snapshot;
  }

  StatusSnapshot Latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
  }

 private:
  mutable std::mutex mutex_;
  StatusSnapshot latest_;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_STATUS_SNAPSHOT_HPP_
