// Repository: rotaplay
// Component: Time Source Interface
// Purpose: Millisecond clock seam. Production uses the monotonic clock;
//          tests drive a deterministic clock by hand.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_TIMING_ITIME_SOURCE_HPP_
#define ROTAPLAY_TIMING_ITIME_SOURCE_HPP_

#include <cstdint>

namespace rotaplay::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

}  // namespace rotaplay::timing

#endif  // ROTAPLAY_TIMING_ITIME_SOURCE_HPP_
