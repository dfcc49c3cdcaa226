// Repository: rotaplay
// Component: Title Overlay
// Purpose: Show/clear scheduling and opacity fades for the title text.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/overlay/TitleOverlay.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "rotaplay/media/IMediaSource.hpp"
#include "rotaplay/media/IOverlaySink.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::overlay {

using rotaplay::runtime::DueTimer;
using rotaplay::runtime::kNoTimer;
using rotaplay::runtime::TimerHandle;
using rotaplay::runtime::TimerToken;
using rotaplay::util::Logger;

namespace {

std::string Seconds(int64_t ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(ms) / 1000.0);
  return buf;
}

}  // namespace

TitleOverlay::TitleOverlay(media::IOverlaySink& sink,
                           runtime::CooperativeScheduler& scheduler,
                           const media::IMediaSource& media,
                           OverlayTiming timing)
    : sink_(sink), scheduler_(scheduler), media_(media), timing_(timing) {}

void TitleOverlay::BeginItem(const library::LibraryItem& item) {
  CancelTimer(show_timer_);

  PendingTitle title;
  title.title = item.title;
  title.artist = item.artist;
  title.degraded = item.metadata_degraded;
  pending_title_ = title;
  pending_swap_.reset();

  // New item: no fade, just drop to 0 and blank.
  CancelTimer(fade_timer_);
  fade_direction_.reset();
  ApplyOpacity(0.0);
  WriteText(PendingTitle());

  show_timer_ = scheduler_.Schedule(timing_.show_delay_ms, TimerToken::kTitleShow);
  Logger::Debug("[TitleOverlay] Scheduled title show in " +
                Seconds(timing_.show_delay_ms) + "s");

  StartDurationPoll();
}

void TitleOverlay::ScheduleClearForDuration(int64_t duration_ms) {
  CancelTimer(clear_timer_);
  clear_scheduled_ = false;

  const int64_t clear_in_ms = duration_ms - timing_.clear_lead_ms;
  if (clear_in_ms <= 0) {
    return;
  }
  clear_timer_ = scheduler_.Schedule(clear_in_ms, TimerToken::kTitleClear);
  clear_scheduled_ = true;
  Logger::Info("[TitleOverlay] Scheduled title fade out in " +
               Seconds(clear_in_ms) + "s");
}

void TitleOverlay::ScheduleClearFromRemaining(int64_t remaining_ms) {
  CancelTimer(clear_timer_);
  clear_scheduled_ = false;

  const int64_t clear_in_ms = remaining_ms - timing_.clear_lead_ms;
  if (clear_in_ms > 0) {
    clear_timer_ = scheduler_.Schedule(clear_in_ms, TimerToken::kTitleClear);
    clear_scheduled_ = true;
    Logger::Info("[TitleOverlay] Scheduled title fade out in " +
                 Seconds(clear_in_ms) + "s (remaining: " +
                 Seconds(remaining_ms) + "s)");
    return;
  }
  if (current_opacity_ > 0.0) {
    Logger::Info("[TitleOverlay] Fade out point has passed, fading now");
    FadeOut();
  }
}

void TitleOverlay::StartDurationPoll() {
  CancelTimer(poll_timer_);
  poll_timer_ = scheduler_.Schedule(timing_.first_duration_check_ms,
                                    TimerToken::kDurationPoll);
}

void TitleOverlay::FadeIn() { StartTransition(100.0, FadeDirection::kIn); }

void TitleOverlay::FadeOut() {
  if (current_opacity_ <= 0.0) return;
  if (fade_direction_ == FadeDirection::kOut && fade_timer_ != kNoTimer) return;
  StartTransition(0.0, FadeDirection::kOut);
}

void TitleOverlay::SwapText(const std::string& title, const std::string& artist,
                            bool degraded) {
  PendingTitle next;
  next.title = title;
  next.artist = artist;
  next.degraded = degraded;

  if (current_opacity_ > 0.0) {
    pending_swap_ = next;
    FadeOut();
    return;
  }
  WriteText(next);
  if (!title.empty() || !artist.empty()) {
    FadeIn();
  }
}

void TitleOverlay::CancelAll() {
  CancelTimer(show_timer_);
  CancelTimer(clear_timer_);
  CancelTimer(poll_timer_);
  pending_title_.reset();
  clear_scheduled_ = false;
}

void TitleOverlay::ClearNow() {
  CancelAll();
  CancelTimer(fade_timer_);
  fade_direction_.reset();
  pending_swap_.reset();
  ApplyOpacity(0.0);
  WriteText(PendingTitle());
}

bool TitleOverlay::OnTimer(const DueTimer& timer) {
  switch (timer.token) {
    case TimerToken::kTitleShow:
      if (timer.handle == show_timer_) OnShow();
      return true;
    case TimerToken::kTitleClear:
      if (timer.handle == clear_timer_) OnClear();
      return true;
    case TimerToken::kDurationPoll:
      if (timer.handle == poll_timer_) OnDurationPoll();
      return true;
    case TimerToken::kFadeStep:
      if (timer.handle == fade_timer_) OnFadeStep();
      return true;
    case TimerToken::kLoopRestart:
      return false;
  }
  return false;
}

void TitleOverlay::OnShow() {
  show_timer_ = kNoTimer;
  if (!pending_title_) return;

  Logger::Info("[TitleOverlay] Showing title: " +
               library::FormatDisplayText(pending_title_->title,
                                          pending_title_->artist,
                                          pending_title_->degraded));
  WriteText(*pending_title_);
  pending_title_.reset();
  FadeIn();
}

void TitleOverlay::OnClear() {
  clear_timer_ = kNoTimer;
  clear_scheduled_ = false;
  Logger::Info("[TitleOverlay] Fading out title before item end");
  FadeOut();
}

void TitleOverlay::OnDurationPoll() {
  poll_timer_ = kNoTimer;
  const int64_t duration_ms = media_.GetDurationMs();
  if (duration_ms > 0) {
    Logger::Debug("[TitleOverlay] Got duration " + Seconds(duration_ms) + "s");
    ScheduleClearForDuration(duration_ms);
    return;
  }
  poll_timer_ = scheduler_.Schedule(timing_.duration_poll_interval_ms,
                                    TimerToken::kDurationPoll);
}

void TitleOverlay::OnFadeStep() {
  double next = current_opacity_ + opacity_step_;
  if (fade_direction_ == FadeDirection::kIn) {
    next = std::min(next, target_opacity_);
  } else {
    next = std::max(next, target_opacity_);
  }
  ApplyOpacity(next);

  if (std::fabs(current_opacity_ - target_opacity_) >= timing_.fade_epsilon) {
    return;
  }

  CancelTimer(fade_timer_);
  ApplyOpacity(target_opacity_);
  const auto finished = fade_direction_;
  fade_direction_.reset();
  Logger::Debug(std::string("[TitleOverlay] Fade ") +
                (finished == FadeDirection::kIn ? "in" : "out") + " complete");

  if (finished == FadeDirection::kOut && current_opacity_ == 0.0 && pending_swap_) {
    const PendingTitle swap = *pending_swap_;
    pending_swap_.reset();
    WriteText(swap);
    FadeIn();
  }
}

void TitleOverlay::StartTransition(double target, FadeDirection direction) {
  CancelTimer(fade_timer_);
  target_opacity_ = target;
  fade_direction_ = direction;

  const double range = std::fabs(target_opacity_ - current_opacity_);
  if (range <= 0.0) {
    fade_direction_.reset();
    return;
  }
  const int steps = std::max(timing_.fade_steps, 1);
  opacity_step_ = range / steps;
  if (direction == FadeDirection::kOut) opacity_step_ = -opacity_step_;

  const int64_t interval_ms = std::max<int64_t>(timing_.fade_duration_ms / steps, 1);
  fade_timer_ = scheduler_.ScheduleRepeating(interval_ms, TimerToken::kFadeStep);
}

void TitleOverlay::ApplyOpacity(double opacity) {
  current_opacity_ = std::clamp(opacity, 0.0, 100.0);
  sink_.SetOpacity(static_cast<int>(std::lround(current_opacity_)));
}

void TitleOverlay::WriteText(const PendingTitle& title) {
  const std::string text =
      library::FormatDisplayText(title.title, title.artist, title.degraded);
  if (!sink_.SetText(text)) {
    Logger::Warn("[TitleOverlay] Overlay sink rejected text: " + text);
  }
}

void TitleOverlay::CancelTimer(TimerHandle& handle) {
  scheduler_.Cancel(handle);
  handle = kNoTimer;
}

}  // namespace rotaplay::overlay
