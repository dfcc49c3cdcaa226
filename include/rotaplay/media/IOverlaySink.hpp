// Repository: rotaplay
// Component: Overlay Sink Interface
// Purpose: Contract for the host's single text overlay slot.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_IOVERLAY_SINK_HPP_
#define ROTAPLAY_MEDIA_IOVERLAY_SINK_HPP_

#include <string>

namespace rotaplay::media {

class IOverlaySink {
 public:
  virtual ~IOverlaySink() = default;

  virtual bool IsAvailable() const = 0;
  virtual bool SetText(const std::string& text) = 0;
  // percent in [0, 100].
  virtual void SetOpacity(int percent) = 0;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_IOVERLAY_SINK_HPP_
