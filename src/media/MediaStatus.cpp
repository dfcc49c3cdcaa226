// Repository: rotaplay
// Component: Media Status
// Purpose: Log names for MediaStatus.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/media/IMediaSource.hpp"

namespace rotaplay::media {

const char* ToString(MediaStatus status) {
  switch (status) {
    case MediaStatus::kNone:
      return "NONE";
    case MediaStatus::kPlaying:
      return "PLAYING";
    case MediaStatus::kStopped:
      return "STOPPED";
    case MediaStatus::kEnded:
      return "ENDED";
  }
  return "UNKNOWN";
}

}  // namespace rotaplay::media
