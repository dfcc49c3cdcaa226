// Repository: rotaplay
// Component: Cooperative Scheduler
// Purpose: Token-based one-shot and repeating timers dispatched on the tick thread.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/CooperativeScheduler.hpp"

#include <algorithm>

namespace rotaplay::runtime {

const char* ToString(TimerToken token) {
  switch (token) {
    case TimerToken::kTitleShow:
      return "title_show";
    case TimerToken::kTitleClear:
      return "title_clear";
    case TimerToken::kDurationPoll:
      return "duration_poll";
    case TimerToken::kFadeStep:
      return "fade_step";
    case TimerToken::kLoopRestart:
      return "loop_restart";
  }
  return "unknown";
}

CooperativeScheduler::CooperativeScheduler(
    std::shared_ptr<timing::ITimeSource> time_source)
    : time_source_(std::move(time_source)) {}

TimerHandle CooperativeScheduler::Schedule(int64_t delay_ms, TimerToken token) {
  return Add(delay_ms, 0, token);
}

TimerHandle CooperativeScheduler::ScheduleRepeating(int64_t interval_ms,
                                                    TimerToken token) {
  // A zero interval would re-fire forever inside one drain.
  return Add(interval_ms, std::max<int64_t>(interval_ms, 1), token);
}

TimerHandle CooperativeScheduler::Add(int64_t delay_ms, int64_t interval_ms,
                                      TimerToken token) {
  Entry entry;
  entry.deadline_ms = time_source_->NowMs() + std::max<int64_t>(delay_ms, 0);
  entry.interval_ms = interval_ms;
  entry.token = token;
  const TimerHandle handle = next_handle_++;
  timers_.emplace(handle, entry);
  return handle;
}

void CooperativeScheduler::Cancel(TimerHandle handle) {
  if (handle == kNoTimer) return;
  timers_.erase(handle);
}

void CooperativeScheduler::CancelAll() { timers_.clear(); }

std::optional<DueTimer> CooperativeScheduler::PopDue() {
  const int64_t now = time_source_->NowMs();
  auto due = timers_.end();
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (it->second.deadline_ms > now) continue;
    // Ties go to the older handle (map order).
    if (due == timers_.end() || it->second.deadline_ms < due->second.deadline_ms) {
      due = it;
    }
  }
  if (due == timers_.end()) {
    return std::nullopt;
  }

  DueTimer fired;
  fired.handle = due->first;
  fired.token = due->second.token;
  if (due->second.interval_ms > 0) {
    due->second.deadline_ms += due->second.interval_ms;
  } else {
    timers_.erase(due);
  }
  return fired;
}

std::optional<int64_t> CooperativeScheduler::NextDueMs() const {
  std::optional<int64_t> next;
  for (const auto& [handle, entry] : timers_) {
    if (!next || entry.deadline_ms < *next) next = entry.deadline_ms;
  }
  return next;
}

bool CooperativeScheduler::IsPending(TimerHandle handle) const {
  return timers_.count(handle) != 0;
}

}  // namespace rotaplay::runtime
