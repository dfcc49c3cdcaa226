// Overlay sink that records every text and opacity write.

#ifndef ROTAPLAY_TESTS_FIXTURES_RECORDING_OVERLAY_SINK_H_
#define ROTAPLAY_TESTS_FIXTURES_RECORDING_OVERLAY_SINK_H_

#include <string>
#include <vector>

#include "rotaplay/media/IOverlaySink.hpp"

namespace rotaplay::tests::fixtures {

class RecordingOverlaySink : public media::IOverlaySink {
 public:
  bool IsAvailable() const override { return available; }

  bool SetText(const std::string& text) override {
    texts.push_back(text);
    if (accept_text) current_text = text;
    return accept_text;
  }

  void SetOpacity(int percent) override {
    opacities.push_back(percent);
    current_opacity = percent;
  }

  bool available = true;
  bool accept_text = true;

  std::string current_text;
  int current_opacity = -1;
  std::vector<std::string> texts;
  std::vector<int> opacities;
};

}  // namespace rotaplay::tests::fixtures

#endif  // ROTAPLAY_TESTS_FIXTURES_RECORDING_OVERLAY_SINK_H_
