// Repository: rotaplay
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in the tick loop.
//          Production: RealtimeWaitStrategy sleeps until the deadline.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_TIMING_IWAIT_STRATEGY_HPP_
#define ROTAPLAY_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <cstdint>
#include <thread>

namespace rotaplay::timing {

class IWaitStrategy {
 public:
  // deadline_ms is expressed in the tick loop's ITimeSource epoch.
  virtual void WaitUntilMs(int64_t deadline_ms) = 0;
  virtual ~IWaitStrategy() = default;
};

// Pairs with SystemTimeSource (steady_clock epoch).
class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitUntilMs(int64_t deadline_ms) override {
    std::this_thread::sleep_until(std::chrono::steady_clock::time_point(
        std::chrono::milliseconds(deadline_ms)));
  }
};

}  // namespace rotaplay::timing

#endif  // ROTAPLAY_TIMING_IWAIT_STRATEGY_HPP_
