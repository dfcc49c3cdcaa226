// Repository: rotaplay
// Component: Orchestrator State
// Purpose: Every piece of mutable playback bookkeeping owned by one controller.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_ORCHESTRATOR_STATE_HPP_
#define ROTAPLAY_RUNTIME_ORCHESTRATOR_STATE_HPP_

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace rotaplay::runtime {

// Owned by PlaybackController and mutated only on the tick thread. A
// default-constructed value is the startup state.
struct OrchestratorState {
  // Whether we believe the host slot is playing one of our items.
  bool is_playing = false;
  std::optional<std::string> current_item_id;
  std::optional<std::string> current_local_path;

  // Pinned item while in Loop mode.
  std::optional<std::string> loop_item_id;

  // Set by every successful start. Single mode refuses to start another
  // item while this is true.
  bool first_item_played = false;

  // No-repeat tracking for the current rotation.
  std::set<std::string> played_set;

  // Seek detection. 0 means no observation since the last reset.
  int64_t last_known_position_ms = 0;

  // Consecutive failed starts. Reset when the host confirms Playing.
  int retry_count = 0;

  // True when the last stop was issued by us. An observed Stopped with this
  // flag clear means somebody else stopped the host.
  bool manual_stop_flag = false;

  bool loop_restart_pending = false;
  std::optional<std::string> loop_restart_item_id;

  // Near-end clear already placed for this approach to the end.
  bool clear_rescheduled = false;

  // Time of the last successful start; anchors the None grace period.
  int64_t started_at_ms = 0;

  // Item was already playing in the host when we attached.
  bool adopted_item = false;

  // Display text handed to the overlay for the current item.
  std::string title_text;

  // Shutdown stop already issued.
  bool shutdown_handled = false;

  // "<item id>_<30 s bucket>" of the last progress line.
  std::string last_progress_key;

  // One-shot guards.
  bool reconciled = false;
  bool waiting_logged = false;
  bool sinks_missing_logged = false;
  std::size_t last_library_size = 0;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_ORCHESTRATOR_STATE_HPP_
