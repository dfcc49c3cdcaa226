// Repository: rotaplay
// Component: Tick Loop
// Purpose: Host cadence for one controller.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/TickLoop.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "rotaplay/runtime/ControlInbox.hpp"
#include "rotaplay/runtime/PlaybackController.hpp"
#include "rotaplay/runtime/StatusSnapshot.hpp"
#include "rotaplay/timing/ITimeSource.hpp"
#include "rotaplay/timing/IWaitStrategy.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::runtime {

using rotaplay::util::Logger;

TickLoop::TickLoop(std::shared_ptr<PlaybackController> controller,
                   std::shared_ptr<ControlInbox> inbox,
                   std::shared_ptr<StatusBoard> status_board,
                   std::shared_ptr<timing::ITimeSource> time_source,
                   std::shared_ptr<timing::IWaitStrategy> wait_strategy,
                   int64_t tick_interval_ms)
    : controller_(std::move(controller)),
      inbox_(std::move(inbox)),
      status_board_(std::move(status_board)),
      time_source_(std::move(time_source)),
      wait_strategy_(std::move(wait_strategy)),
      tick_interval_ms_(std::max<int64_t>(tick_interval_ms, 1)) {}

int64_t TickLoop::RunOnce() {
  if (!started_) {
    started_ = true;
    next_tick_ms_ = time_source_->NowMs();
  }

  if (inbox_) inbox_->ApplyTo(*controller_);
  controller_->RunDueTimers();

  const int64_t now = time_source_->NowMs();
  if (now >= next_tick_ms_) {
    controller_->Tick();
    ++tick_count_;
    // Late ticks are not replayed; the cadence restarts from now.
    next_tick_ms_ += tick_interval_ms_;
    if (next_tick_ms_ <= now) next_tick_ms_ = now + tick_interval_ms_;
  }

  Publish();

  int64_t deadline = std::min(next_tick_ms_, now + kMaxWaitMs);
  if (auto timer_due = controller_->NextTimerDueMs()) {
    deadline = std::min(deadline, std::max(*timer_due, now));
  }
  return deadline;
}

void TickLoop::RunUntil(const std::atomic<bool>& terminate) {
  Logger::Info("[TickLoop] Started (tick interval " +
               std::to_string(tick_interval_ms_) + "ms)");

  while (!terminate.load(std::memory_order_acquire)) {
    const int64_t deadline = RunOnce();
    if (controller_->shutdown_requested()) break;
    if (terminate.load(std::memory_order_acquire)) break;
    wait_strategy_->WaitUntilMs(deadline);
  }

  // Orderly stop: adapter cleared, overlay cleared, timers cancelled.
  controller_->RequestShutdown();
  controller_->Tick();
  ++tick_count_;
  Publish();
  Logger::Info("[TickLoop] Stopped after " + std::to_string(tick_count_) + " tick(s)");
}

void TickLoop::Publish() {
  if (!status_board_) return;
  // Snapshot reads the host adapter; a failing adapter leaves the previous
  // snapshot in place.
  try {
    status_board_->Publish(controller_->Snapshot());
  } catch (const std::exception& e) {
    Logger::Error("[TickLoop] Status publish failed: " + std::string(e.what()));
  }
}

}  // namespace rotaplay::runtime
