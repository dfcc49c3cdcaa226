// Repository: rotaplay
// Component: Media Source Interface
// Purpose: Contract for the host's single controllable media slot.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_IMEDIA_SOURCE_HPP_
#define ROTAPLAY_MEDIA_IMEDIA_SOURCE_HPP_

#include <cstdint>
#include <string>

namespace rotaplay::media {

// Coarse status as polled from the host. There are no finer events.
enum class MediaStatus {
  kNone,     // Nothing loaded, or the host is still loading.
  kPlaying,
  kStopped,
  kEnded,
};

const char* ToString(MediaStatus status);

// IMediaSource wraps the host media slot. Every call is made from the tick
// thread; implementations need not be thread-safe.
class IMediaSource {
 public:
  virtual ~IMediaSource() = default;

  // False while the host sink does not exist. The controller skips the tick.
  virtual bool IsAvailable() const = 0;

  virtual MediaStatus GetStatus() const = 0;

  // 0 when unknown (not loaded yet, or still probing).
  virtual int64_t GetDurationMs() const = 0;
  virtual int64_t GetPositionMs() const = 0;

  // force_reload must restart playback even when path equals the active
  // path (detach and reattach, not a no-op update).
  virtual bool SetLocalFile(const std::string& path, bool force_reload) = 0;

  virtual void StopAndClear() = 0;

  // Empty when nothing is loaded.
  virtual std::string GetActiveLocalPath() const = 0;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_IMEDIA_SOURCE_HPP_
