// Repository: rotaplay
// Component: Playback Transition Table
// Purpose: Declared (host status × guard) → action table for the state handlers.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_PLAYBACK_TRANSITIONS_HPP_
#define ROTAPLAY_RUNTIME_PLAYBACK_TRANSITIONS_HPP_

#include <vector>

#include "rotaplay/media/IMediaSource.hpp"
#include "rotaplay/runtime/PlaybackTypes.hpp"

namespace rotaplay::runtime {

// What the controller does for one dispatched tick.
enum class TickAction {
  kNoop,
  kSyncPlaying,          // Host plays, we did not know: adopt it.
  kTrackProgress,        // Seek detection and near-end clear scheduling.
  kScheduleLoopRestart,  // Loop: replay the ended item after a short delay.
  kStartNext,            // Select and start.
  kStartFresh,           // Loop pin cleared first, then select and start.
  kDetectManualStop,     // Somebody else stopped the host: full stop.
  kRetryStart,           // We stopped it and it is still stopped: retry.
  kFullStop,
  kResetDesync,          // We believe playing, host has nothing loaded.
};

const char* ToString(TickAction action);

// Snapshot of everything the guards read. Built by the controller each tick.
struct TransitionInput {
  media::MediaStatus status = media::MediaStatus::kNone;
  PlaybackMode mode = PlaybackMode::kContinuous;
  bool is_playing = false;
  bool visible = true;
  bool library_empty = true;
  bool manual_stop_flag = false;
  bool loop_restart_pending = false;
  bool first_item_played = false;
  // Item was already playing in the host when we attached.
  bool adopted_item = false;
  int retry_count = 0;
  int retry_cap = 3;
  bool none_grace_elapsed = false;
};

using TransitionGuard = bool (*)(const TransitionInput&);

struct Transition {
  media::MediaStatus status;
  const char* guard_name;
  TransitionGuard guard;
  TickAction action;
};

// Rows in evaluation order. For a given status the first row whose guard
// holds is taken.
const std::vector<Transition>& TransitionTable();

// First matching row for input.status. Every status has a catch-all row, so
// the result is always defined.
const Transition& Decide(const TransitionInput& input);

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_PLAYBACK_TRANSITIONS_HPP_
