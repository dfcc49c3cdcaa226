// Repository: rotaplay
// Component: FFmpeg Duration Probe
// Purpose: Container duration via libavformat.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_FFMPEG_DURATION_PROBE_HPP_
#define ROTAPLAY_MEDIA_FFMPEG_DURATION_PROBE_HPP_

#include "rotaplay/media/IDurationProbe.hpp"

namespace rotaplay::media {

// Opens the file, reads stream info, returns the container duration.
// Without FFmpeg at build time every probe fails.
class FfmpegDurationProbe : public IDurationProbe {
 public:
  std::optional<int64_t> ProbeDurationMs(const std::string& path) override;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_FFMPEG_DURATION_PROBE_HPP_
