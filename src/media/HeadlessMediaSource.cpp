// Repository: rotaplay
// Component: Headless Media Source
// Purpose: In-process model of one host media slot.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/media/HeadlessMediaSource.hpp"

#include <algorithm>

#include "rotaplay/timing/ITimeSource.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::media {

using rotaplay::util::Logger;

HeadlessMediaSource::HeadlessMediaSource(
    std::shared_ptr<IDurationProbe> probe,
    std::shared_ptr<timing::ITimeSource> time_source)
    : probe_(std::move(probe)), time_source_(std::move(time_source)) {}

MediaStatus HeadlessMediaSource::GetStatus() const {
  if (active_path_.empty()) {
    return stopped_ ? MediaStatus::kStopped : MediaStatus::kNone;
  }
  if (time_source_->NowMs() - started_at_ms_ >= duration_ms_) {
    return MediaStatus::kEnded;
  }
  return MediaStatus::kPlaying;
}

int64_t HeadlessMediaSource::GetDurationMs() const {
  return active_path_.empty() ? 0 : duration_ms_;
}

int64_t HeadlessMediaSource::GetPositionMs() const {
  if (active_path_.empty()) return 0;
  const int64_t elapsed = time_source_->NowMs() - started_at_ms_;
  return std::clamp<int64_t>(elapsed, 0, duration_ms_);
}

bool HeadlessMediaSource::SetLocalFile(const std::string& path, bool force_reload) {
  if (!force_reload && path == active_path_ && GetStatus() == MediaStatus::kPlaying) {
    return true;
  }

  const auto duration = probe_->ProbeDurationMs(path);
  if (!duration) {
    Logger::Warn("[HeadlessMediaSource] Cannot load " + path);
    return false;
  }
  if (*duration <= 0) {
    Logger::Warn("[HeadlessMediaSource] No duration for " + path);
    return false;
  }

  // Reload of the same path restarts from 0, like detach + reattach.
  active_path_ = path;
  duration_ms_ = *duration;
  started_at_ms_ = time_source_->NowMs();
  stopped_ = false;
  ++load_count_;
  Logger::Debug("[HeadlessMediaSource] Loaded " + path + " (" +
                std::to_string(duration_ms_) + "ms" +
                (force_reload ? ", forced" : "") + ")");
  return true;
}

void HeadlessMediaSource::StopAndClear() {
  active_path_.clear();
  duration_ms_ = 0;
  stopped_ = true;
}

}  // namespace rotaplay::media
