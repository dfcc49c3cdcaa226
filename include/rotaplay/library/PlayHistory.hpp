// Repository: rotaplay
// Component: Play History
// Purpose: Persists the no-repeat played set across restarts.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_LIBRARY_PLAY_HISTORY_HPP_
#define ROTAPLAY_LIBRARY_PLAY_HISTORY_HPP_

#include <set>
#include <string>
#include <vector>

namespace rotaplay::library {

// File format: {"played_videos": ["id1", "id2"]}. A bare JSON array of
// strings is accepted on load for files written by older versions.
class PlayHistory {
 public:
  static constexpr const char* kDefaultFileName = "play_history.json";

  // Missing file → empty list. Corrupt file → empty list and a warning.
  static std::vector<std::string> Load(const std::string& path);

  // Creates the parent directory if needed. Returns false on I/O failure.
  static bool Save(const std::string& path, const std::set<std::string>& ids);

  static std::string Serialize(const std::set<std::string>& ids);
  // Returns false if the document is not one of the accepted shapes.
  static bool Parse(const std::string& json, std::vector<std::string>* out);
};

}  // namespace rotaplay::library

#endif  // ROTAPLAY_LIBRARY_PLAY_HISTORY_HPP_
