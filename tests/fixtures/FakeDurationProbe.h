// Duration probe with a fixed path → duration table.

#ifndef ROTAPLAY_TESTS_FIXTURES_FAKE_DURATION_PROBE_H_
#define ROTAPLAY_TESTS_FIXTURES_FAKE_DURATION_PROBE_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "rotaplay/media/IDurationProbe.hpp"

namespace rotaplay::tests::fixtures {

class FakeDurationProbe : public media::IDurationProbe {
 public:
  std::optional<int64_t> ProbeDurationMs(const std::string& path) override {
    ++probe_count;
    auto it = durations.find(path);
    if (it == durations.end()) return std::nullopt;
    return it->second;
  }

  std::map<std::string, int64_t> durations;
  int probe_count = 0;
};

}  // namespace rotaplay::tests::fixtures

#endif  // ROTAPLAY_TESTS_FIXTURES_FAKE_DURATION_PROBE_H_
