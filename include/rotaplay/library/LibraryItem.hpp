// Repository: rotaplay
// Component: Library Item
// Purpose: One playable unit: a cached local media file plus display metadata.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_LIBRARY_LIBRARY_ITEM_HPP_
#define ROTAPLAY_LIBRARY_LIBRARY_ITEM_HPP_

#include <string>

namespace rotaplay::library {

struct LibraryItem {
  std::string id;
  std::string local_path;
  std::string title;
  std::string artist;
  // True when title/artist came from the filename fallback rather than the
  // metadata extractor. The overlay marks such titles.
  bool metadata_degraded = false;
};

// "Title - Artist", or whichever half is present. Degraded metadata gets a
// trailing warning marker. Empty when both halves are empty.
std::string FormatDisplayText(const std::string& title,
                              const std::string& artist,
                              bool degraded);

}  // namespace rotaplay::library

#endif  // ROTAPLAY_LIBRARY_LIBRARY_ITEM_HPP_
