// Repository: rotaplay
// Component: Duration Probe Interface
// Purpose: Reads a media file's duration for the headless media slot.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_IDURATION_PROBE_HPP_
#define ROTAPLAY_MEDIA_IDURATION_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace rotaplay::media {

class IDurationProbe {
 public:
  virtual ~IDurationProbe() = default;
  // nullopt when the file cannot be opened or parsed. 0 when the container
  // does not declare a duration.
  virtual std::optional<int64_t> ProbeDurationMs(const std::string& path) = 0;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_IDURATION_PROBE_HPP_
