// Repository: rotaplay
// Component: Player Configuration
// Purpose: Process-level settings and command-line / environment parsing.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_PLAYER_CONFIG_HPP_
#define ROTAPLAY_RUNTIME_PLAYER_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "rotaplay/runtime/PlaybackController.hpp"

namespace rotaplay::runtime {

struct PlayerConfig {
  int64_t tick_interval_ms = 1000;
  ControllerConfig controller;

  // Directory holding processed media files (see CacheScanner).
  std::string cache_dir = "cache";
  int64_t rescan_interval_ms = 30000;
  uint64_t min_file_bytes = 1024 * 1024;

  // Title text file; opacity goes to "<overlay_path>.opacity".
  std::string overlay_path = "now_playing.txt";

  // Empty means <cache_dir>/play_history.json.
  std::string history_file;

  std::string listen_address = "127.0.0.1:50071";
  bool enable_control_service = true;
};

// Effective history file path for config.
std::string ResolveHistoryPath(const PlayerConfig& config);

struct PlayerArgs {
  PlayerConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Environment defaults (ROTAPLAY_CACHE_DIR, ROTAPLAY_LISTEN_ADDRESS,
// ROTAPLAY_MODE) are applied first; flags override them.
PlayerArgs ParsePlayerArgs(int argc, char* argv[]);

void PrintPlayerUsage(const char* program_name);

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_PLAYER_CONFIG_HPP_
