// Repository: rotaplay
// Component: Video Selector
// Purpose: Mode-aware "what plays next" policy with no-repeat rotation.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_VIDEO_SELECTOR_HPP_
#define ROTAPLAY_RUNTIME_VIDEO_SELECTOR_HPP_

#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "rotaplay/runtime/PlaybackTypes.hpp"

namespace rotaplay::runtime {

// SelectNext picks the next item id. It is a pure function of its arguments
// plus the random engine, so a seeded engine gives a reproducible sequence.
//
// Rules, first match wins:
//   1. Empty library → nullopt.
//   2. Loop mode with loop_item_id present in library → loop_item_id.
//   3. Library of one → that id; played is left untouched.
//      One unplayed id left → that id; the rotation is complete, so played
//      is cleared.
//   4. played covers the library → clear it.
//   5. Uniform choice from library − played (whole library if that is
//      empty); the choice is added to played.
//   6. Loop mode with nothing pinned → the choice becomes loop_item_id.
//
// played may contain stale ids (items since removed); they are ignored.
std::optional<std::string> SelectNext(PlaybackMode mode,
                                      const std::vector<std::string>& library,
                                      std::set<std::string>& played,
                                      std::optional<std::string>& loop_item_id,
                                      std::mt19937& rng);

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_VIDEO_SELECTOR_HPP_
