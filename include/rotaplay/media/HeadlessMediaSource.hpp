// Repository: rotaplay
// Component: Headless Media Source
// Purpose: In-process model of one host media slot, driven by a time source.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_HEADLESS_MEDIA_SOURCE_HPP_
#define ROTAPLAY_MEDIA_HEADLESS_MEDIA_SOURCE_HPP_

#include <memory>
#include <string>

#include "rotaplay/media/IDurationProbe.hpp"
#include "rotaplay/media/IMediaSource.hpp"

namespace rotaplay::timing {
class ITimeSource;
}  // namespace rotaplay::timing

namespace rotaplay::media {

// Plays nothing: it only keeps the clock. A loaded file reports Playing with
// the position advancing with the time source and Ended once the probed
// duration has elapsed. StopAndClear reports Stopped until the next load.
class HeadlessMediaSource : public IMediaSource {
 public:
  HeadlessMediaSource(std::shared_ptr<IDurationProbe> probe,
                      std::shared_ptr<timing::ITimeSource> time_source);

  bool IsAvailable() const override { return true; }
  MediaStatus GetStatus() const override;
  int64_t GetDurationMs() const override;
  int64_t GetPositionMs() const override;
  bool SetLocalFile(const std::string& path, bool force_reload) override;
  void StopAndClear() override;
  std::string GetActiveLocalPath() const override { return active_path_; }

  int load_count() const { return load_count_; }

 private:
  std::shared_ptr<IDurationProbe> probe_;
  std::shared_ptr<timing::ITimeSource> time_source_;

  std::string active_path_;
  int64_t duration_ms_ = 0;
  int64_t started_at_ms_ = 0;
  bool stopped_ = false;
  int load_count_ = 0;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_HEADLESS_MEDIA_SOURCE_HPP_
