// Repository: rotaplay
// Component: Playback Controller
// Purpose: Tick-driven orchestrator. Polls host media status, applies the
//          transition table, selects and starts items, drives the title overlay.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_PLAYBACK_CONTROLLER_HPP_
#define ROTAPLAY_RUNTIME_PLAYBACK_CONTROLLER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "rotaplay/media/IMediaSource.hpp"
#include "rotaplay/overlay/TitleOverlay.hpp"
#include "rotaplay/runtime/CooperativeScheduler.hpp"
#include "rotaplay/runtime/OrchestratorState.hpp"
#include "rotaplay/runtime/PlaybackTransitions.hpp"
#include "rotaplay/runtime/PlaybackTypes.hpp"
#include "rotaplay/runtime/StatusSnapshot.hpp"

namespace rotaplay::library {
class LibraryStore;
}  // namespace rotaplay::library

namespace rotaplay::media {
class IOverlaySink;
}  // namespace rotaplay::media

namespace rotaplay::timing {
class ITimeSource;
}  // namespace rotaplay::timing

namespace rotaplay::runtime {

struct ControllerConfig {
  // Forward position jump that counts as a seek.
  int64_t seek_threshold_ms = 5000;
  // The near-end clear is (re)placed once remaining time drops below
  // overlay.clear_lead_ms + near_end_margin_ms.
  int64_t near_end_margin_ms = 5000;
  // Adopted host playback gets a clear if this close to the end.
  int64_t adopt_clear_margin_ms = 10000;
  int64_t loop_restart_delay_ms = 1000;
  // Host loading lag tolerated before a None while playing resets state.
  int64_t none_grace_ms = 5000;
  int retry_cap = 3;
  int64_t progress_log_interval_ms = 30000;
  // Continuous mode keeps running while the scene is hidden.
  bool continuous_plays_when_hidden = true;
  PlaybackMode initial_mode = PlaybackMode::kContinuous;
  bool initial_scene_visible = true;
  // Empty disables play history persistence.
  std::string history_path;
  // 0 seeds from std::random_device.
  uint32_t rng_seed = 0;
  overlay::OverlayTiming overlay;
};

// PlaybackController is the single entry point driven by the host tick.
// Tick() implements the per-tick contract; RunDueTimers() delivers scheduled
// show/clear/fade/restart callbacks. Both must be called from the same thread
// and never concurrently, which is what TickLoop does.
//
// Mode, visibility and shutdown setters take effect immediately. Other
// threads go through ControlInbox instead of calling them directly.
class PlaybackController {
 public:
  PlaybackController(std::shared_ptr<library::LibraryStore> store,
                     std::shared_ptr<media::IMediaSource> media,
                     std::shared_ptr<media::IOverlaySink> overlay_sink,
                     std::shared_ptr<timing::ITimeSource> time_source,
                     ControllerConfig config = ControllerConfig());
  ~PlaybackController();

  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  // One host tick. Never throws.
  void Tick();

  // Dispatches every timer that is due. Never throws.
  void RunDueTimers();
  [[nodiscard]] std::optional<int64_t> NextTimerDueMs() const;

  void SetPlaybackMode(PlaybackMode mode);
  PlaybackMode playback_mode() const { return mode_; }

  void SetSceneVisible(bool visible);
  bool scene_visible() const { return visible_; }

  // Next tick performs a full stop and nothing else.
  void RequestShutdown();
  bool shutdown_requested() const { return shutdown_; }

  const OrchestratorState& state() const { return state_; }
  const overlay::TitleOverlay& overlay() const { return *overlay_; }
  const CooperativeScheduler& scheduler() const { return scheduler_; }

  // Must be called on the tick thread (reads the media source).
  StatusSnapshot Snapshot() const;

 private:
  void TickInternal();
  // First tick with sinks available. Returns true when the tick is consumed.
  bool ReconcileHostPlayback(media::MediaStatus status);
  void Dispatch(media::MediaStatus status);

  void OnSyncPlaying();
  void OnTrackProgress();
  void OnScheduleLoopRestart();
  void OnDetectManualStop();
  void OnRetryStart();
  void OnResetDesync();
  void OnLoopRestartTimer();

  bool StartNextItem();
  bool StartSpecificItem(const std::string& id);
  void FullStop(const std::string& reason);

  void MarkStarted(const library::LibraryItem& item);
  // Swaps the on-screen title when the current item's metadata was edited
  // while it plays.
  void RefreshTitle();
  void ResetTracking();
  void CancelLoopRestart();
  void LogProgress(int64_t position_ms, int64_t duration_ms);
  void SaveHistory();
  std::optional<std::string> IdentifyActiveItem() const;
  std::string DescribeContext() const;

  std::shared_ptr<library::LibraryStore> store_;
  std::shared_ptr<media::IMediaSource> media_;
  std::shared_ptr<media::IOverlaySink> overlay_sink_;
  std::shared_ptr<timing::ITimeSource> time_source_;
  const ControllerConfig config_;

  CooperativeScheduler scheduler_;
  std::unique_ptr<overlay::TitleOverlay> overlay_;
  std::mt19937 rng_;

  OrchestratorState state_;
  PlaybackMode mode_;
  bool visible_;
  bool shutdown_ = false;
  TimerHandle loop_restart_timer_ = kNoTimer;
  // Last status read by Tick(), for error context.
  media::MediaStatus last_status_ = media::MediaStatus::kNone;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_PLAYBACK_CONTROLLER_HPP_
