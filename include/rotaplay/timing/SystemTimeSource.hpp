// Repository: rotaplay
// Component: System Time Source
// Purpose: Monotonic millisecond clock for the production tick loop.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_TIMING_SYSTEM_TIME_SOURCE_HPP_
#define ROTAPLAY_TIMING_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "rotaplay/timing/ITimeSource.hpp"

namespace rotaplay::timing {

// Steady clock, not wall clock: deadlines must not jump when NTP adjusts
// the system time. RealtimeWaitStrategy relies on the same epoch.
class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace rotaplay::timing

#endif  // ROTAPLAY_TIMING_SYSTEM_TIME_SOURCE_HPP_
