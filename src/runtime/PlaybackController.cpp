// Repository: rotaplay
// Component: Playback Controller
// Purpose: Tick-driven orchestrator. Polls host media status, applies the
//          transition table, selects and starts items, drives the title overlay.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/PlaybackController.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <vector>

#include "rotaplay/library/LibraryStore.hpp"
#include "rotaplay/library/PlayHistory.hpp"
#include "rotaplay/media/IOverlaySink.hpp"
#include "rotaplay/runtime/VideoSelector.hpp"
#include "rotaplay/timing/ITimeSource.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::runtime {

using media::MediaStatus;
using rotaplay::util::Logger;

namespace {

std::string FormatClock(int64_t ms) {
  const int64_t total_s = ms / 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld",
                static_cast<long long>(total_s / 60),
                static_cast<long long>(total_s % 60));
  return buf;
}

std::string Describe(const library::LibraryItem& item) {
  const std::string text =
      library::FormatDisplayText(item.title, item.artist, item.metadata_degraded);
  return (text.empty() ? item.id : text) + " [" + item.id + "]";
}

uint32_t SeedFor(uint32_t configured) {
  if (configured != 0) return configured;
  std::random_device rd;
  return rd();
}

}  // namespace

PlaybackController::PlaybackController(
    std::shared_ptr<library::LibraryStore> store,
    std::shared_ptr<media::IMediaSource> media,
    std::shared_ptr<media::IOverlaySink> overlay_sink,
    std::shared_ptr<timing::ITimeSource> time_source,
    ControllerConfig config)
    : store_(std::move(store)),
      media_(std::move(media)),
      overlay_sink_(std::move(overlay_sink)),
      time_source_(std::move(time_source)),
      config_(std::move(config)),
      scheduler_(time_source_),
      rng_(SeedFor(config_.rng_seed)),
      mode_(config_.initial_mode),
      visible_(config_.initial_scene_visible) {
  overlay_ = std::make_unique<overlay::TitleOverlay>(*overlay_sink_, scheduler_,
                                                     *media_, config_.overlay);

  if (!config_.history_path.empty()) {
    const auto ids = library::PlayHistory::Load(config_.history_path);
    state_.played_set.insert(ids.begin(), ids.end());
    if (!ids.empty()) {
      Logger::Info("[PlaybackController] Loaded play history: " +
                   std::to_string(ids.size()) + " played item(s)");
    }
  }

  Logger::Info(std::string("[PlaybackController] Initialized (mode: ") +
               ToString(mode_) + ", visible: " + (visible_ ? "yes" : "no") + ")");
}

PlaybackController::~PlaybackController() = default;

// =============================================================================
// Tick entry points
// =============================================================================

void PlaybackController::Tick() {
  try {
    TickInternal();
  } catch (const std::exception& e) {
    Logger::Error("[PlaybackController] Tick failed: " + std::string(e.what()) +
                  " (" + DescribeContext() + ")");
  }
}

void PlaybackController::RunDueTimers() {
  try {
    while (auto due = scheduler_.PopDue()) {
      if (due->token == TimerToken::kLoopRestart) {
        if (due->handle == loop_restart_timer_) OnLoopRestartTimer();
        continue;
      }
      overlay_->OnTimer(*due);
    }
  } catch (const std::exception& e) {
    Logger::Error("[PlaybackController] Timer dispatch failed: " +
                  std::string(e.what()) + " (" + DescribeContext() + ")");
  }
}

std::optional<int64_t> PlaybackController::NextTimerDueMs() const {
  return scheduler_.NextDueMs();
}

void PlaybackController::TickInternal() {
  // 1. Shutdown wins over everything. Idle or not, overlay and loop timers
  // go too.
  if (shutdown_) {
    if (!state_.shutdown_handled) {
      state_.shutdown_handled = true;
      FullStop("shutdown requested");
    }
    return;
  }

  // 2. Sinks must exist; re-check next tick.
  if (!media_->IsAvailable() || !overlay_sink_->IsAvailable()) {
    if (!state_.sinks_missing_logged) {
      Logger::Warn("[PlaybackController] Media or overlay sink unavailable, waiting");
      state_.sinks_missing_logged = true;
    }
    return;
  }
  state_.sinks_missing_logged = false;

  // 3. Scene visibility.
  if (!visible_) {
    if (!state_.is_playing) {
      state_.waiting_logged = false;
      return;
    }
    const bool keep_running = mode_ == PlaybackMode::kContinuous &&
                              config_.continuous_plays_when_hidden;
    if (!keep_running) {
      if (mode_ == PlaybackMode::kLoop) {
        state_.loop_item_id.reset();
        state_.first_item_played = false;
      }
      FullStop(std::string("scene hidden in ") + ToString(mode_) + " mode");
      return;
    }
    Logger::Debug("[PlaybackController] Scene hidden, continuing in continuous mode");
  }

  // 4. Nothing to play yet.
  const std::size_t library_size = store_->Size();
  if (library_size != state_.last_library_size) {
    if (state_.last_library_size == 0 && library_size > 0) {
      Logger::Info("[PlaybackController] First item available, library size " +
                   std::to_string(library_size));
    } else if (library_size > state_.last_library_size) {
      Logger::Info("[PlaybackController] New item added, library size " +
                   std::to_string(library_size));
    }
    state_.last_library_size = library_size;
  }
  if (library_size == 0) {
    if (!state_.waiting_logged) {
      Logger::Info("[PlaybackController] Waiting for items to be ingested...");
      state_.waiting_logged = true;
    }
    return;
  }
  state_.waiting_logged = false;

  const MediaStatus status = media_->GetStatus();
  last_status_ = status;

  // 5. Host may already be playing from a previous session.
  if (!state_.reconciled) {
    state_.reconciled = true;
    Logger::Debug(std::string("[PlaybackController] First tick: host status ") +
                  media::ToString(status) + ", playing " +
                  (state_.is_playing ? "yes" : "no"));
    if (ReconcileHostPlayback(status)) return;
  }

  // 6. Visible and idle: start now, whatever the (lagging) host status says.
  if (visible_ && !state_.is_playing) {
    if (mode_ == PlaybackMode::kSingle && state_.first_item_played) {
      // Single mode already ran its item. Stay idle.
    } else {
      if (mode_ == PlaybackMode::kLoop && state_.loop_item_id) {
        Logger::Info("[PlaybackController] Loop mode: clearing previous loop item for a fresh pick");
        state_.loop_item_id.reset();
      }
      Logger::Info(std::string("[PlaybackController] Scene visible but idle (host ") +
                   media::ToString(status) + "), starting playback");
      StartNextItem();
      return;
    }
  }

  // 7. Per-status handlers.
  Dispatch(status);
}

bool PlaybackController::ReconcileHostPlayback(MediaStatus status) {
  if (status != MediaStatus::kPlaying || state_.is_playing) {
    return false;
  }

  const int64_t duration_ms = media_->GetDurationMs();
  if (duration_ms <= 0) {
    Logger::Info("[PlaybackController] Host reports playing without valid media, starting fresh");
    StartNextItem();
    return true;
  }

  Logger::Info("[PlaybackController] Host already playing, adopting pre-loaded media");
  state_.is_playing = true;
  state_.adopted_item = true;
  state_.started_at_ms = time_source_->NowMs();

  if (auto id = IdentifyActiveItem()) {
    state_.current_item_id = id;
    state_.current_local_path = media_->GetActiveLocalPath();
    store_->SetCurrentItem(id);
    Logger::Info("[PlaybackController] Identified pre-loaded item: " + *id);
    if (mode_ == PlaybackMode::kLoop && !state_.loop_item_id) {
      state_.loop_item_id = id;
      Logger::Info("[PlaybackController] Loop mode: pinned pre-loaded item " + *id);
    }
  }

  const int64_t position_ms = media_->GetPositionMs();
  if (position_ms > 0) {
    const int64_t remaining_ms = duration_ms - position_ms;
    if (remaining_ms > 0 &&
        remaining_ms < config_.overlay.clear_lead_ms + config_.adopt_clear_margin_ms) {
      overlay_->ScheduleClearFromRemaining(remaining_ms);
    }
  }
  return true;
}

void PlaybackController::Dispatch(MediaStatus status) {
  TransitionInput input;
  input.status = status;
  input.mode = mode_;
  input.is_playing = state_.is_playing;
  input.visible = visible_;
  input.library_empty = store_->Empty();
  input.manual_stop_flag = state_.manual_stop_flag;
  input.loop_restart_pending = state_.loop_restart_pending;
  input.first_item_played = state_.first_item_played;
  input.adopted_item = state_.adopted_item;
  input.retry_count = state_.retry_count;
  input.retry_cap = config_.retry_cap;
  input.none_grace_elapsed =
      time_source_->NowMs() - state_.started_at_ms >= config_.none_grace_ms;

  const Transition& row = Decide(input);
  if (row.action != TickAction::kNoop && row.action != TickAction::kTrackProgress) {
    Logger::Debug(std::string("[PlaybackController] ") + media::ToString(status) +
                  " / " + row.guard_name + " -> " + ToString(row.action));
  }

  switch (row.action) {
    case TickAction::kNoop:
      // Ended handling always resets seek tracking, even when idle.
      if (status == MediaStatus::kEnded) ResetTracking();
      break;
    case TickAction::kSyncPlaying:
      OnSyncPlaying();
      break;
    case TickAction::kTrackProgress:
      OnTrackProgress();
      break;
    case TickAction::kScheduleLoopRestart:
      ResetTracking();
      OnScheduleLoopRestart();
      break;
    case TickAction::kStartNext:
      ResetTracking();
      Logger::Info("[PlaybackController] Playback ended, starting next item");
      StartNextItem();
      break;
    case TickAction::kStartFresh:
      if (mode_ == PlaybackMode::kLoop && state_.loop_item_id) {
        Logger::Info("[PlaybackController] Loop mode: clearing previous loop item for a fresh pick");
        state_.loop_item_id.reset();
      }
      Logger::Info("[PlaybackController] Nothing loaded and items available, starting playback");
      StartNextItem();
      break;
    case TickAction::kDetectManualStop:
      OnDetectManualStop();
      break;
    case TickAction::kRetryStart:
      OnRetryStart();
      break;
    case TickAction::kFullStop:
      if (status == MediaStatus::kEnded) {
        ResetTracking();
        if (state_.adopted_item) state_.first_item_played = true;
        FullStop("single mode item finished");
      } else {
        FullStop("max retries reached");
      }
      break;
    case TickAction::kResetDesync:
      OnResetDesync();
      break;
  }
}

// =============================================================================
// State handlers
// =============================================================================

void PlaybackController::OnSyncPlaying() {
  state_.manual_stop_flag = false;

  const int64_t duration_ms = media_->GetDurationMs();
  if (duration_ms <= 0) {
    Logger::Info("[PlaybackController] Host playing without valid media, starting fresh");
    StartNextItem();
    return;
  }

  Logger::Info("[PlaybackController] Host playing but state out of sync, adopting");
  state_.is_playing = true;
  state_.retry_count = 0;
  state_.started_at_ms = time_source_->NowMs();

  if (!state_.current_item_id) {
    if (auto id = IdentifyActiveItem()) {
      state_.current_item_id = id;
      state_.current_local_path = media_->GetActiveLocalPath();
      store_->SetCurrentItem(id);
      Logger::Info("[PlaybackController] Identified current item: " + *id);
      if (mode_ == PlaybackMode::kLoop && !state_.loop_item_id) {
        state_.loop_item_id = id;
        Logger::Info("[PlaybackController] Loop mode: pinned current item " + *id);
      }
    }
  }
}

void PlaybackController::OnTrackProgress() {
  state_.manual_stop_flag = false;

  if (state_.loop_restart_pending && state_.loop_restart_item_id &&
      state_.current_item_id == state_.loop_restart_item_id) {
    Logger::Info("[PlaybackController] Loop restart completed");
    state_.loop_restart_pending = false;
    state_.loop_restart_item_id.reset();
  }

  const int64_t duration_ms = media_->GetDurationMs();
  const int64_t position_ms = media_->GetPositionMs();
  if (duration_ms <= 0 || position_ms <= 0) {
    return;
  }

  // The host is demonstrably playing our item.
  state_.retry_count = 0;
  RefreshTitle();

  if (state_.last_known_position_ms > 0 &&
      position_ms - state_.last_known_position_ms > config_.seek_threshold_ms) {
    Logger::Info("[PlaybackController] Seek detected: " +
                 FormatClock(state_.last_known_position_ms) + " -> " +
                 FormatClock(position_ms));
    state_.clear_rescheduled = false;
  }
  state_.last_known_position_ms = position_ms;

  LogProgress(position_ms, duration_ms);

  const int64_t remaining_ms = duration_ms - position_ms;
  const int64_t window_ms = config_.overlay.clear_lead_ms + config_.near_end_margin_ms;
  if (remaining_ms > 0 && remaining_ms < window_ms) {
    if (!state_.clear_rescheduled || !overlay_->IsClearScheduled()) {
      overlay_->ScheduleClearFromRemaining(remaining_ms);
      state_.clear_rescheduled = true;
    }
  }
}

void PlaybackController::OnScheduleLoopRestart() {
  std::optional<std::string> ended_id = state_.current_item_id;
  if (!ended_id) ended_id = IdentifyActiveItem();

  if (!ended_id) {
    Logger::Warn("[PlaybackController] Loop mode: could not identify ended item, selecting next");
    StartNextItem();
    return;
  }

  if (!state_.loop_item_id) {
    state_.loop_item_id = ended_id;
    Logger::Info("[PlaybackController] Loop mode: pinned ended item " + *ended_id);
  }
  state_.adopted_item = false;
  state_.loop_restart_pending = true;
  state_.loop_restart_item_id = ended_id;

  scheduler_.Cancel(loop_restart_timer_);
  loop_restart_timer_ =
      scheduler_.Schedule(config_.loop_restart_delay_ms, TimerToken::kLoopRestart);
  Logger::Info("[PlaybackController] Loop mode: replaying " + *ended_id + " in " +
               std::to_string(config_.loop_restart_delay_ms) + "ms");
}

void PlaybackController::OnDetectManualStop() {
  Logger::Info("[PlaybackController] Host stopped externally, treating as manual stop");
  if (mode_ == PlaybackMode::kLoop) {
    state_.loop_item_id.reset();
  }
  FullStop("manual stop");
}

void PlaybackController::OnRetryStart() {
  ++state_.retry_count;
  Logger::Warn("[PlaybackController] Host still stopped, retry " +
               std::to_string(state_.retry_count) + "/" +
               std::to_string(config_.retry_cap));
  StartNextItem();
}

void PlaybackController::OnResetDesync() {
  Logger::Warn("[PlaybackController] Playing state but host has no media after grace period, resetting");
  state_.is_playing = false;
}

void PlaybackController::OnLoopRestartTimer() {
  loop_restart_timer_ = kNoTimer;
  const auto id = state_.loop_restart_item_id;
  if (!id) return;
  StartSpecificItem(*id);
}

// =============================================================================
// Start / stop
// =============================================================================

bool PlaybackController::StartNextItem() {
  overlay_->CancelAll();

  if (mode_ == PlaybackMode::kSingle && state_.first_item_played) {
    Logger::Info("[PlaybackController] Single mode: item already played, stopping");
    FullStop("single mode complete");
    return false;
  }

  // Entries whose file has vanished are dropped and selection is retried,
  // at most once per library entry.
  std::optional<library::LibraryItem> item;
  const std::size_t max_attempts = store_->Size() + 1;
  for (std::size_t attempt = 0; attempt < max_attempts && !item; ++attempt) {
    // Ids() leaves out entries whose removal is pending.
    const std::vector<std::string> ids = store_->Ids();
    if (state_.loop_item_id &&
        std::find(ids.begin(), ids.end(), *state_.loop_item_id) == ids.end()) {
      Logger::Info("[PlaybackController] Loop item " + *state_.loop_item_id +
                   " left the library, unpinning");
      state_.loop_item_id.reset();
    }
    const std::set<std::string> played_before = state_.played_set;
    const auto chosen =
        SelectNext(mode_, ids, state_.played_set, state_.loop_item_id, rng_);
    if (state_.played_set != played_before) SaveHistory();

    if (!chosen) {
      Logger::Info("[PlaybackController] No item available to play");
      if (state_.is_playing) FullStop("no item available");
      return false;
    }

    auto candidate = store_->Get(*chosen);
    if (!candidate) {
      Logger::Warn("[PlaybackController] Selected item vanished from library: " + *chosen);
      continue;
    }
    if (!store_->ContainsValidFile(*chosen)) {
      Logger::Warn("[PlaybackController] File missing for " + *chosen +
                   ", removing entry and selecting another");
      store_->Remove(*chosen);
      state_.played_set.erase(*chosen);
      if (state_.loop_item_id == chosen) state_.loop_item_id.reset();
      continue;
    }
    item = std::move(candidate);
  }

  if (!item) {
    Logger::Error("[PlaybackController] No playable item found after " +
                  std::to_string(max_attempts) + " attempt(s)");
    if (state_.is_playing) FullStop("no playable item");
    return false;
  }

  if (!media_->SetLocalFile(item->local_path, false)) {
    Logger::Warn("[PlaybackController] Media source refused " + Describe(*item));
    if (state_.retry_count < config_.retry_cap) {
      ++state_.retry_count;
      return StartNextItem();
    }
    Logger::Error("[PlaybackController] Max retries reached, stopping (" +
                  DescribeContext() + ")");
    FullStop("max retries reached");
    // The next start attempt gets a fresh budget.
    state_.retry_count = 0;
    return false;
  }

  overlay_->BeginItem(*item);
  const bool first = !state_.first_item_played;
  MarkStarted(*item);

  if (first && mode_ == PlaybackMode::kSingle) {
    Logger::Info("[PlaybackController] Single mode: started first and only item " +
                 Describe(*item));
  } else if (first && mode_ == PlaybackMode::kLoop) {
    Logger::Info("[PlaybackController] Loop mode: started first item " + Describe(*item));
  } else {
    Logger::Info("[PlaybackController] Started playback: " + Describe(*item));
  }
  return true;
}

bool PlaybackController::StartSpecificItem(const std::string& id) {
  overlay_->CancelAll();

  const auto item = store_->Get(id);
  const bool leaving = store_->PendingRemovals().count(id) > 0;
  if (!item || leaving || !store_->ContainsValidFile(id)) {
    Logger::Warn("[PlaybackController] Loop item " + id +
                 " is no longer playable, selecting another");
    if (item) store_->Remove(id);
    state_.loop_restart_pending = false;
    state_.loop_restart_item_id.reset();
    if (state_.loop_item_id == id) state_.loop_item_id.reset();
    return StartNextItem();
  }

  // Same path as the ended item: force the host to reload it.
  if (!media_->SetLocalFile(item->local_path, true)) {
    Logger::Error("[PlaybackController] Failed to restart loop item " + Describe(*item));
    state_.loop_restart_pending = false;
    state_.loop_restart_item_id.reset();
    state_.is_playing = false;
    return false;
  }

  overlay_->BeginItem(*item);
  MarkStarted(*item);
  Logger::Info("[PlaybackController] Started playback (loop): " + Describe(*item));
  return true;
}

void PlaybackController::MarkStarted(const library::LibraryItem& item) {
  state_.is_playing = true;
  state_.current_item_id = item.id;
  state_.current_local_path = item.local_path;
  state_.title_text =
      library::FormatDisplayText(item.title, item.artist, item.metadata_degraded);
  state_.first_item_played = true;
  state_.adopted_item = false;
  state_.started_at_ms = time_source_->NowMs();
  state_.last_known_position_ms = 0;
  state_.clear_rescheduled = false;
  state_.last_progress_key.clear();
  store_->SetCurrentItem(item.id);
}

void PlaybackController::FullStop(const std::string& reason) {
  overlay_->ClearNow();
  CancelLoopRestart();
  // Any Stopped we observe from here on is one we caused.
  state_.manual_stop_flag = true;

  if (!state_.is_playing) {
    Logger::Debug("[PlaybackController] No active playback to stop (" + reason + ")");
    return;
  }

  media_->StopAndClear();
  state_.is_playing = false;
  state_.current_item_id.reset();
  state_.current_local_path.reset();
  state_.title_text.clear();
  state_.adopted_item = false;
  store_->SetCurrentItem(std::nullopt);
  ResetTracking();
  Logger::Info("[PlaybackController] Playback stopped: " + reason);
}

void PlaybackController::ResetTracking() {
  state_.last_known_position_ms = 0;
  state_.last_progress_key.clear();
  state_.retry_count = 0;
  state_.clear_rescheduled = false;
}

void PlaybackController::CancelLoopRestart() {
  scheduler_.Cancel(loop_restart_timer_);
  loop_restart_timer_ = kNoTimer;
  state_.loop_restart_pending = false;
  state_.loop_restart_item_id.reset();
}

// =============================================================================
// Controls
// =============================================================================

void PlaybackController::SetPlaybackMode(PlaybackMode mode) {
  if (mode == mode_) return;
  const PlaybackMode old_mode = mode_;
  mode_ = mode;
  Logger::Info(std::string("[PlaybackController] Playback mode changed: ") +
               ToString(old_mode) + " -> " + ToString(mode));

  if (old_mode == PlaybackMode::kLoop && state_.loop_restart_pending) {
    CancelLoopRestart();
  }

  state_.first_item_played = mode == PlaybackMode::kSingle && state_.is_playing;
  if (state_.first_item_played) {
    Logger::Info("[PlaybackController] Single mode: current item counts as the only item");
  }

  if (mode == PlaybackMode::kLoop) {
    if (state_.is_playing) {
      std::optional<std::string> id = state_.current_item_id;
      if (!id) id = IdentifyActiveItem();
      if (id) {
        state_.loop_item_id = id;
        Logger::Info("[PlaybackController] Loop mode: pinned current item " + *id);
      }
    }
  } else {
    state_.loop_item_id.reset();
  }
}

void PlaybackController::SetSceneVisible(bool visible) {
  if (visible == visible_) return;
  visible_ = visible;
  Logger::Info(std::string("[PlaybackController] Scene ") +
               (visible ? "visible" : "hidden"));
}

void PlaybackController::RequestShutdown() {
  if (shutdown_) return;
  shutdown_ = true;
  Logger::Info("[PlaybackController] Shutdown requested");
}

// =============================================================================
// Helpers
// =============================================================================

void PlaybackController::LogProgress(int64_t position_ms, int64_t duration_ms) {
  if (!state_.current_item_id || config_.progress_log_interval_ms <= 0) return;
  const std::string key = *state_.current_item_id + "_" +
                          std::to_string(position_ms / config_.progress_log_interval_ms);
  if (key == state_.last_progress_key) return;
  state_.last_progress_key = key;

  const auto item = store_->Get(*state_.current_item_id);
  if (!item) return;
  const int64_t percent = position_ms * 100 / duration_ms;
  Logger::Info("[PlaybackController] Playing: " + Describe(*item) + " [" +
               std::to_string(percent) + "% - " + FormatClock(position_ms) + " / " +
               FormatClock(duration_ms) + "]");
}

void PlaybackController::RefreshTitle() {
  if (!state_.current_item_id || state_.adopted_item || state_.title_text.empty()) {
    return;
  }
  const auto item = store_->Get(*state_.current_item_id);
  if (!item) return;
  const std::string text =
      library::FormatDisplayText(item->title, item->artist, item->metadata_degraded);
  if (text.empty() || text == state_.title_text) return;
  // The scheduled show still carries the old text; swap once it has fired.
  if (overlay_->IsShowPending()) return;

  state_.title_text = text;
  if (overlay_->opacity() <= 0.0 ||
      overlay_->fade_direction() == overlay::FadeDirection::kOut) {
    Logger::Debug("[PlaybackController] Metadata changed after title cleared: " + text);
    return;
  }
  Logger::Info("[PlaybackController] Metadata changed, updating title: " + text);
  overlay_->SwapText(item->title, item->artist, item->metadata_degraded);
}

void PlaybackController::SaveHistory() {
  if (config_.history_path.empty()) return;
  if (!library::PlayHistory::Save(config_.history_path, state_.played_set)) {
    Logger::Warn("[PlaybackController] Could not persist play history to " +
                 config_.history_path);
  }
}

std::optional<std::string> PlaybackController::IdentifyActiveItem() const {
  const std::string path = media_->GetActiveLocalPath();
  if (path.empty()) return std::nullopt;
  return store_->FindByLocalPath(path);
}

std::string PlaybackController::DescribeContext() const {
  return std::string("item=") + state_.current_item_id.value_or("-") +
         " mode=" + ToString(mode_) + " status=" + media::ToString(last_status_);
}

StatusSnapshot PlaybackController::Snapshot() const {
  StatusSnapshot snap;
  snap.mode = mode_;
  snap.scene_visible = visible_;
  snap.is_playing = state_.is_playing;
  snap.host_status = media_->GetStatus();
  snap.current_item_id = state_.current_item_id.value_or("");
  snap.loop_item_id = state_.loop_item_id.value_or("");
  if (state_.current_item_id) {
    if (auto item = store_->Get(*state_.current_item_id)) {
      snap.display_text = library::FormatDisplayText(item->title, item->artist,
                                                     item->metadata_degraded);
    }
  }
  if (state_.is_playing) {
    snap.position_ms = media_->GetPositionMs();
    snap.duration_ms = media_->GetDurationMs();
  }
  snap.library_size = static_cast<uint32_t>(store_->Size());
  snap.played_count = static_cast<uint32_t>(state_.played_set.size());
  snap.retry_count = state_.retry_count;
  snap.first_item_played = state_.first_item_played;
  snap.shutdown_requested = shutdown_;
  snap.overlay_opacity = static_cast<int>(overlay_->opacity() + 0.5);
  return snap;
}

}  // namespace rotaplay::runtime
