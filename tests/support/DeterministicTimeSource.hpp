// Repository: rotaplay
// Component: Deterministic Time Source (test only)
// Purpose: Hand-driven millisecond clock. Nothing advances unless a test says so.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
#define ROTAPLAY_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

#include <atomic>
#include <cstdint>

#include "rotaplay/timing/ITimeSource.hpp"

namespace rotaplay::tests {

class DeterministicTimeSource : public timing::ITimeSource {
 public:
  explicit DeterministicTimeSource(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowMs() const override { return now_ms_.load(); }

  void AdvanceMs(int64_t delta) { now_ms_.fetch_add(delta); }
  void SetMs(int64_t value) { now_ms_.store(value); }

 private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace rotaplay::tests

#endif  // ROTAPLAY_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
