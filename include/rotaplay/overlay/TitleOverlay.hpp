// Repository: rotaplay
// Component: Title Overlay
// Purpose: Show/clear scheduling and opacity fades for the title text,
//          synchronized to the playing item's position.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_OVERLAY_TITLE_OVERLAY_HPP_
#define ROTAPLAY_OVERLAY_TITLE_OVERLAY_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "rotaplay/library/LibraryItem.hpp"
#include "rotaplay/runtime/CooperativeScheduler.hpp"

namespace rotaplay::media {
class IMediaSource;
class IOverlaySink;
}  // namespace rotaplay::media

namespace rotaplay::overlay {

struct OverlayTiming {
  int64_t show_delay_ms = 1500;
  // The title fades out this long before the item ends.
  int64_t clear_lead_ms = 3500;
  int64_t first_duration_check_ms = 200;
  int64_t duration_poll_interval_ms = 500;
  int64_t fade_duration_ms = 1000;
  int fade_steps = 20;
  double fade_epsilon = 0.1;
};

enum class FadeDirection { kIn, kOut };

struct PendingTitle {
  std::string title;
  std::string artist;
  bool degraded = false;
};

// TitleOverlay owns the show timer, the clear timer, the duration poll and
// the fade ramp. Each is cancel-and-replace: scheduling a new one cancels the
// outstanding one, so at most one of each kind is ever pending.
//
// Runs on the tick thread. Timers fire through the shared scheduler and are
// routed back here by OnTimer().
class TitleOverlay {
 public:
  TitleOverlay(media::IOverlaySink& sink,
               runtime::CooperativeScheduler& scheduler,
               const media::IMediaSource& media,
               OverlayTiming timing = OverlayTiming());

  TitleOverlay(const TitleOverlay&) = delete;
  TitleOverlay& operator=(const TitleOverlay&) = delete;

  // New item started: blank text at opacity 0, show the title after
  // show_delay_ms, and start polling for the duration to place the clear.
  void BeginItem(const library::LibraryItem& item);

  // Clear at duration - clear_lead_ms from now. Not scheduled when that is
  // not in the future.
  void ScheduleClearForDuration(int64_t duration_ms);

  // Clear at remaining - clear_lead_ms from now; fades out immediately if
  // that moment has already passed and the title is visible.
  void ScheduleClearFromRemaining(int64_t remaining_ms);

  void StartDurationPoll();

  void FadeIn();
  // No-op at opacity 0 or while a fade-out is already running.
  void FadeOut();

  // Fades out the current text first if visible, then swaps and fades in.
  void SwapText(const std::string& title, const std::string& artist,
                bool degraded);

  // Cancels show/clear/poll timers and forgets the pending title. A running
  // fade is left to finish.
  void CancelAll();

  // Full stop: cancel everything including the fade, blank the text.
  void ClearNow();

  // Returns false for tokens this component does not own.
  bool OnTimer(const runtime::DueTimer& timer);

  bool IsClearScheduled() const { return clear_scheduled_; }
  bool IsShowPending() const { return show_timer_ != runtime::kNoTimer; }
  bool IsFading() const { return fade_timer_ != runtime::kNoTimer; }
  double opacity() const { return current_opacity_; }
  std::optional<FadeDirection> fade_direction() const { return fade_direction_; }
  const std::optional<PendingTitle>& pending_title() const { return pending_title_; }
  runtime::TimerHandle clear_timer() const { return clear_timer_; }

 private:
  void OnShow();
  void OnClear();
  void OnDurationPoll();
  void OnFadeStep();

  void StartTransition(double target, FadeDirection direction);
  void ApplyOpacity(double opacity);
  void WriteText(const PendingTitle& title);
  void CancelTimer(runtime::TimerHandle& handle);

  media::IOverlaySink& sink_;
  runtime::CooperativeScheduler& scheduler_;
  const media::IMediaSource& media_;
  const OverlayTiming timing_;

  runtime::TimerHandle show_timer_ = runtime::kNoTimer;
  runtime::TimerHandle clear_timer_ = runtime::kNoTimer;
  runtime::TimerHandle poll_timer_ = runtime::kNoTimer;
  runtime::TimerHandle fade_timer_ = runtime::kNoTimer;
  bool clear_scheduled_ = false;

  std::optional<PendingTitle> pending_title_;
  // Text waiting for a fade-out to reach 0.
  std::optional<PendingTitle> pending_swap_;

  double current_opacity_ = 0.0;
  double target_opacity_ = 0.0;
  double opacity_step_ = 0.0;
  std::optional<FadeDirection> fade_direction_;
};

}  // namespace rotaplay::overlay

#endif  // ROTAPLAY_OVERLAY_TITLE_OVERLAY_HPP_
