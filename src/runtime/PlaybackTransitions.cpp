// Repository: rotaplay
// Component: Playback Transition Table
// Purpose: Declared (host status × guard) → action table for the state handlers.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/PlaybackTransitions.hpp"

namespace rotaplay::runtime {

using media::MediaStatus;

namespace {

// Named guards. Kept as plain functions so the table reads as data.
bool Always(const TransitionInput&) { return true; }
bool NotPlaying(const TransitionInput& in) { return !in.is_playing; }
bool Hidden(const TransitionInput& in) { return !in.visible; }

bool LoopRestartPending(const TransitionInput& in) {
  return in.mode == PlaybackMode::kLoop && in.loop_restart_pending;
}

bool LoopMode(const TransitionInput& in) { return in.mode == PlaybackMode::kLoop; }

// An adopted item counts as the one Single mode allows.
bool SingleItemDone(const TransitionInput& in) {
  return in.mode == PlaybackMode::kSingle &&
         (in.first_item_played || in.adopted_item);
}

// Host stopped while we did not ask for it.
bool ExternalStop(const TransitionInput& in) { return !in.manual_stop_flag; }

bool RetryBudgetLeft(const TransitionInput& in) {
  return in.retry_count < in.retry_cap;
}

bool IdleWithoutItems(const TransitionInput& in) {
  return !in.is_playing && in.library_empty;
}

bool IdleAfterSingleItem(const TransitionInput& in) {
  return !in.is_playing && in.mode == PlaybackMode::kSingle &&
         in.first_item_played;
}

bool WithinNoneGrace(const TransitionInput& in) { return !in.none_grace_elapsed; }

}  // namespace

const char* ToString(TickAction action) {
  switch (action) {
    case TickAction::kNoop:
      return "noop";
    case TickAction::kSyncPlaying:
      return "sync_playing";
    case TickAction::kTrackProgress:
      return "track_progress";
    case TickAction::kScheduleLoopRestart:
      return "schedule_loop_restart";
    case TickAction::kStartNext:
      return "start_next";
    case TickAction::kStartFresh:
      return "start_fresh";
    case TickAction::kDetectManualStop:
      return "detect_manual_stop";
    case TickAction::kRetryStart:
      return "retry_start";
    case TickAction::kFullStop:
      return "full_stop";
    case TickAction::kResetDesync:
      return "reset_desync";
  }
  return "unknown";
}

const std::vector<Transition>& TransitionTable() {
  static const std::vector<Transition> kTable = {
      // PLAYING
      {MediaStatus::kPlaying, "not_playing", NotPlaying, TickAction::kSyncPlaying},
      {MediaStatus::kPlaying, "always", Always, TickAction::kTrackProgress},

      // ENDED
      {MediaStatus::kEnded, "not_playing", NotPlaying, TickAction::kNoop},
      {MediaStatus::kEnded, "loop_restart_pending", LoopRestartPending, TickAction::kNoop},
      {MediaStatus::kEnded, "loop_mode", LoopMode, TickAction::kScheduleLoopRestart},
      {MediaStatus::kEnded, "single_item_done", SingleItemDone, TickAction::kFullStop},
      {MediaStatus::kEnded, "always", Always, TickAction::kStartNext},

      // STOPPED
      {MediaStatus::kStopped, "not_playing", NotPlaying, TickAction::kNoop},
      {MediaStatus::kStopped, "external_stop", ExternalStop, TickAction::kDetectManualStop},
      {MediaStatus::kStopped, "retry_budget_left", RetryBudgetLeft, TickAction::kRetryStart},
      {MediaStatus::kStopped, "always", Always, TickAction::kFullStop},

      // NONE
      {MediaStatus::kNone, "hidden", Hidden, TickAction::kNoop},
      {MediaStatus::kNone, "idle_without_items", IdleWithoutItems, TickAction::kNoop},
      {MediaStatus::kNone, "idle_after_single_item", IdleAfterSingleItem, TickAction::kNoop},
      {MediaStatus::kNone, "not_playing", NotPlaying, TickAction::kStartFresh},
      {MediaStatus::kNone, "within_none_grace", WithinNoneGrace, TickAction::kNoop},
      {MediaStatus::kNone, "always", Always, TickAction::kResetDesync},
  };
  return kTable;
}

const Transition& Decide(const TransitionInput& input) {
  const auto& table = TransitionTable();
  for (const auto& row : table) {
    if (row.status == input.status && row.guard(input)) {
      return row;
    }
  }
  // Unreachable while every status ends with an "always" row.
  static const Transition kFallback = {MediaStatus::kNone, "fallback", Always,
                                       TickAction::kNoop};
  return kFallback;
}

}  // namespace rotaplay::runtime
