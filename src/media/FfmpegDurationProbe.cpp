// Repository: rotaplay
// Component: FFmpeg Duration Probe
// Purpose: Container duration via libavformat.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/media/FfmpegDurationProbe.hpp"

#include <chrono>

#include "rotaplay/util/Logger.hpp"

#ifdef ROTAPLAY_FFMPEG_AVAILABLE
extern "C" {
#include <libavformat/avformat.h>
}
#endif

namespace rotaplay::media {

using rotaplay::util::Logger;

std::optional<int64_t> FfmpegDurationProbe::ProbeDurationMs(const std::string& path) {
#ifdef ROTAPLAY_FFMPEG_AVAILABLE
  AVFormatContext* fmt_ctx = nullptr;

  const auto open_start = std::chrono::steady_clock::now();
  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    Logger::Warn("[FfmpegDurationProbe] Failed to open: " + path);
    return std::nullopt;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    Logger::Warn("[FfmpegDurationProbe] Failed to find stream info: " + path);
    return std::nullopt;
  }

  int64_t duration_ms = 0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    duration_ms = fmt_ctx->duration / 1000;  // AV_TIME_BASE is microseconds
  }
  avformat_close_input(&fmt_ctx);

  const auto probe_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - open_start).count();
  Logger::Debug("[FfmpegDurationProbe] Probed " + path + " (" +
                std::to_string(duration_ms) + "ms, took " +
                std::to_string(probe_ms) + "ms)");
  return duration_ms;
#else
  Logger::Error("[FfmpegDurationProbe] FFmpeg not available, cannot probe " + path);
  return std::nullopt;
#endif
}

}  // namespace rotaplay::media
