// Repository: rotaplay
// Component: Cooperative Scheduler
// Purpose: Token-based one-shot and repeating timers dispatched on the tick thread.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_COOPERATIVE_SCHEDULER_HPP_
#define ROTAPLAY_RUNTIME_COOPERATIVE_SCHEDULER_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>

#include "rotaplay/timing/ITimeSource.hpp"

namespace rotaplay::runtime {

// What a timer means when it fires. The owner of the scheduler routes the
// token to its handler; no closures are stored.
enum class TimerToken {
  kTitleShow,
  kTitleClear,
  kDurationPoll,
  kFadeStep,
  kLoopRestart,
};

const char* ToString(TimerToken token);

using TimerHandle = uint64_t;
constexpr TimerHandle kNoTimer = 0;

struct DueTimer {
  TimerHandle handle = kNoTimer;
  TimerToken token = TimerToken::kTitleShow;
};

// CooperativeScheduler holds pending timers for one controller. It never
// creates threads and never calls out: the tick loop asks for due timers with
// PopDue() and dispatches them itself, so a timer callback can never run
// concurrently with a tick.
//
// Not thread-safe. Owned and used by the tick thread only.
class CooperativeScheduler {
 public:
  explicit CooperativeScheduler(std::shared_ptr<timing::ITimeSource> time_source);

  CooperativeScheduler(const CooperativeScheduler&) = delete;
  CooperativeScheduler& operator=(const CooperativeScheduler&) = delete;

  TimerHandle Schedule(int64_t delay_ms, TimerToken token);

  // Fires every interval_ms until cancelled. First fire at now + interval_ms.
  TimerHandle ScheduleRepeating(int64_t interval_ms, TimerToken token);

  // Idempotent. Cancelling kNoTimer or an already fired one-shot is a no-op.
  void Cancel(TimerHandle handle);
  void CancelAll();

  // Returns the earliest timer whose deadline has passed, or nullopt.
  // One-shots are removed; repeating timers are re-armed from their previous
  // deadline. Call in a loop to drain.
  std::optional<DueTimer> PopDue();

  [[nodiscard]] std::optional<int64_t> NextDueMs() const;
  [[nodiscard]] bool IsPending(TimerHandle handle) const;
  [[nodiscard]] std::size_t PendingCount() const { return timers_.size(); }

  int64_t NowMs() const { return time_source_->NowMs(); }

 private:
  struct Entry {
    int64_t deadline_ms = 0;
    int64_t interval_ms = 0;  // 0 for one-shot.
    TimerToken token = TimerToken::kTitleShow;
  };

  TimerHandle Add(int64_t delay_ms, int64_t interval_ms, TimerToken token);

  std::shared_ptr<timing::ITimeSource> time_source_;
  std::map<TimerHandle, Entry> timers_;
  TimerHandle next_handle_ = 1;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_COOPERATIVE_SCHEDULER_HPP_
