// Repository: rotaplay
// Component: Tick Loop
// Purpose: Host cadence for one controller: inbox, due timers, periodic tick,
//          status publication, bounded wait.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_TICK_LOOP_HPP_
#define ROTAPLAY_RUNTIME_TICK_LOOP_HPP_

#include <atomic>
#include <cstdint>
#include <memory>

namespace rotaplay::timing {
class ITimeSource;
class IWaitStrategy;
}  // namespace rotaplay::timing

namespace rotaplay::runtime {

class ControlInbox;
class PlaybackController;
class StatusBoard;

class TickLoop {
 public:
  static constexpr int64_t kDefaultTickIntervalMs = 1000;
  // Upper bound on one wait, so inbox commands are picked up promptly.
  static constexpr int64_t kMaxWaitMs = 100;

  TickLoop(std::shared_ptr<PlaybackController> controller,
           std::shared_ptr<ControlInbox> inbox,
           std::shared_ptr<StatusBoard> status_board,
           std::shared_ptr<timing::ITimeSource> time_source,
           std::shared_ptr<timing::IWaitStrategy> wait_strategy,
           int64_t tick_interval_ms = kDefaultTickIntervalMs);

  TickLoop(const TickLoop&) = delete;
  TickLoop& operator=(const TickLoop&) = delete;

  // One iteration without waiting. Returns the deadline for the next one.
  int64_t RunOnce();

  // Iterates until terminate is set or the controller has processed a
  // shutdown, then runs a final shutdown tick.
  void RunUntil(const std::atomic<bool>& terminate);

  uint64_t tick_count() const { return tick_count_; }

 private:
  void Publish();

  std::shared_ptr<PlaybackController> controller_;
  std::shared_ptr<ControlInbox> inbox_;
  std::shared_ptr<StatusBoard> status_board_;
  std::shared_ptr<timing::ITimeSource> time_source_;
  std::shared_ptr<timing::IWaitStrategy> wait_strategy_;
  const int64_t tick_interval_ms_;

  bool started_ = false;
  int64_t next_tick_ms_ = 0;
  uint64_t tick_count_ = 0;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_TICK_LOOP_HPP_
