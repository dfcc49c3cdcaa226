// Repository: rotaplay
// Component: Text File Overlay
// Purpose: IOverlaySink that publishes title text and opacity as files for an
//          external compositor.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_MEDIA_TEXT_FILE_OVERLAY_HPP_
#define ROTAPLAY_MEDIA_TEXT_FILE_OVERLAY_HPP_

#include <string>

#include "rotaplay/media/IOverlaySink.hpp"

namespace rotaplay::media {

// Text goes to text_path, opacity (integer percent) to text_path + ".opacity".
// Both are written to a temporary file and renamed into place, so readers
// never see a partial write.
class TextFileOverlay : public IOverlaySink {
 public:
  explicit TextFileOverlay(std::string text_path);

  bool IsAvailable() const override;
  bool SetText(const std::string& text) override;
  void SetOpacity(int percent) override;

  const std::string& text_path() const { return text_path_; }
  std::string opacity_path() const { return text_path_ + ".opacity"; }

 private:
  const std::string text_path_;
  int last_opacity_ = -1;
};

}  // namespace rotaplay::media

#endif  // ROTAPLAY_MEDIA_TEXT_FILE_OVERLAY_HPP_
