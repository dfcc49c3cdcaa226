// Repository: rotaplay
// Component: Player Configuration
// Purpose: Command-line / environment parsing for the player executable.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/PlayerConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "rotaplay/library/PlayHistory.hpp"

namespace rotaplay::runtime {

namespace {

// Parses a non-negative integer flag value. Returns false on garbage.
bool ParseCount(const std::string& text, int64_t* out) {
  try {
    size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size() || value < 0) return false;
    *out = static_cast<int64_t>(value);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

void ApplyEnvironment(PlayerConfig& config, std::string* error) {
  if (const char* dir = std::getenv("ROTAPLAY_CACHE_DIR"); dir && *dir) {
    config.cache_dir = dir;
  }
  if (const char* addr = std::getenv("ROTAPLAY_LISTEN_ADDRESS"); addr && *addr) {
    config.listen_address = addr;
  }
  if (const char* mode = std::getenv("ROTAPLAY_MODE"); mode && *mode) {
    if (auto parsed = ParsePlaybackMode(mode)) {
      config.controller.initial_mode = *parsed;
    } else {
      *error = std::string("Invalid ROTAPLAY_MODE: ") + mode;
    }
  }
}

}  // namespace

std::string ResolveHistoryPath(const PlayerConfig& config) {
  if (!config.history_file.empty()) return config.history_file;
  return (std::filesystem::path(config.cache_dir) /
          library::PlayHistory::kDefaultFileName).string();
}

void PrintPlayerUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Unattended rotating playback of a cached media library.\n"
            << "\n"
            << "LIBRARY:\n"
            << "  --cache-dir DIR        Processed media directory (env ROTAPLAY_CACHE_DIR, default: cache)\n"
            << "  --rescan-ms MS         Cache rescan interval (default: 30000)\n"
            << "  --min-file-bytes N     Smallest file treated as complete (default: 1048576)\n"
            << "  --history-file PATH    Play history file (default: <cache-dir>/play_history.json)\n"
            << "\n"
            << "PLAYBACK:\n"
            << "  --mode MODE            continuous | single | loop (env ROTAPLAY_MODE)\n"
            << "  --hidden               Start with the scene hidden\n"
            << "  --stop-when-hidden     Continuous mode stops while hidden\n"
            << "  --tick-ms MS           Controller tick interval (default: 1000)\n"
            << "  --retry-cap N          Failed starts before giving up (default: 3)\n"
            << "  --seed N               Fixed selection seed (default: random)\n"
            << "\n"
            << "OUTPUT / CONTROL:\n"
            << "  --overlay-file PATH    Title text output (default: now_playing.txt)\n"
            << "  --listen ADDR          gRPC control address (env ROTAPLAY_LISTEN_ADDRESS)\n"
            << "  --no-control           Do not start the gRPC control service\n"
            << "  --help                 Show this help message\n"
            << "\n";
}

PlayerArgs ParsePlayerArgs(int argc, char* argv[]) {
  PlayerArgs args;
  ApplyEnvironment(args.config, &args.error);
  if (!args.error.empty()) {
    return args;
  }

  PlayerConfig& config = args.config;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    int64_t number = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--cache-dir" && has_value) {
      config.cache_dir = argv[++i];
    } else if (arg == "--rescan-ms" && has_value) {
      if (!ParseCount(argv[++i], &number) || number == 0) {
        args.error = "Invalid value for --rescan-ms";
        return args;
      }
      config.rescan_interval_ms = number;
    } else if (arg == "--min-file-bytes" && has_value) {
      if (!ParseCount(argv[++i], &number)) {
        args.error = "Invalid value for --min-file-bytes";
        return args;
      }
      config.min_file_bytes = static_cast<uint64_t>(number);
    } else if (arg == "--history-file" && has_value) {
      config.history_file = argv[++i];
    } else if (arg == "--mode" && has_value) {
      const std::string value = argv[++i];
      auto mode = ParsePlaybackMode(value);
      if (!mode) {
        args.error = "Unknown playback mode: " + value;
        return args;
      }
      config.controller.initial_mode = *mode;
    } else if (arg == "--hidden") {
      config.controller.initial_scene_visible = false;
    } else if (arg == "--stop-when-hidden") {
      config.controller.continuous_plays_when_hidden = false;
    } else if (arg == "--tick-ms" && has_value) {
      if (!ParseCount(argv[++i], &number) || number == 0) {
        args.error = "Invalid value for --tick-ms";
        return args;
      }
      config.tick_interval_ms = number;
    } else if (arg == "--retry-cap" && has_value) {
      if (!ParseCount(argv[++i], &number)) {
        args.error = "Invalid value for --retry-cap";
        return args;
      }
      config.controller.retry_cap = static_cast<int>(number);
    } else if (arg == "--seed" && has_value) {
      if (!ParseCount(argv[++i], &number)) {
        args.error = "Invalid value for --seed";
        return args;
      }
      config.controller.rng_seed = static_cast<uint32_t>(number);
    } else if (arg == "--overlay-file" && has_value) {
      config.overlay_path = argv[++i];
    } else if (arg == "--listen" && has_value) {
      config.listen_address = argv[++i];
    } else if (arg == "--no-control") {
      config.enable_control_service = false;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (config.cache_dir.empty()) {
    args.error = "--cache-dir must not be empty";
    return args;
  }
  if (config.overlay_path.empty()) {
    args.error = "--overlay-file must not be empty";
    return args;
  }

  config.controller.history_path = ResolveHistoryPath(config);
  args.valid = true;
  return args;
}

}  // namespace rotaplay::runtime
