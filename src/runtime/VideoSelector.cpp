// Repository: rotaplay
// Component: Video Selector
// Purpose: Mode-aware "what plays next" policy with no-repeat rotation.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/VideoSelector.hpp"

#include <algorithm>

#include "rotaplay/util/Logger.hpp"

namespace rotaplay::runtime {

using rotaplay::util::Logger;

namespace {

void PinIfUnset(PlaybackMode mode, std::optional<std::string>& loop_item_id,
                const std::string& id) {
  if (mode == PlaybackMode::kLoop && !loop_item_id) {
    loop_item_id = id;
    Logger::Info("[VideoSelector] Loop mode: pinned " + id);
  }
}

}  // namespace

std::optional<std::string> SelectNext(PlaybackMode mode,
                                      const std::vector<std::string>& library,
                                      std::set<std::string>& played,
                                      std::optional<std::string>& loop_item_id,
                                      std::mt19937& rng) {
  if (library.empty()) {
    return std::nullopt;
  }

  if (mode == PlaybackMode::kLoop && loop_item_id &&
      std::find(library.begin(), library.end(), *loop_item_id) != library.end()) {
    return loop_item_id;
  }

  if (library.size() == 1) {
    PinIfUnset(mode, loop_item_id, library.front());
    return library.front();
  }

  std::vector<std::string> unplayed;
  for (const auto& id : library) {
    if (played.count(id) == 0) unplayed.push_back(id);
  }

  if (unplayed.size() == 1) {
    // Last item of the rotation. Start the next rotation fresh.
    played.clear();
    Logger::Debug("[VideoSelector] Rotation complete, played set reset");
    PinIfUnset(mode, loop_item_id, unplayed.front());
    return unplayed.front();
  }

  if (unplayed.empty()) {
    played.clear();
    Logger::Debug("[VideoSelector] Played set covered library, reset");
    unplayed = library;
  }

  std::uniform_int_distribution<std::size_t> pick(0, unplayed.size() - 1);
  const std::string chosen = unplayed[pick(rng)];
  played.insert(chosen);
  PinIfUnset(mode, loop_item_id, chosen);
  return chosen;
}

}  // namespace rotaplay::runtime
