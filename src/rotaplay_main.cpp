// Repository: rotaplay
// Component: Player Executable
// Purpose: Wires the library, headless host adapters, controller, tick loop
//          and gRPC control service into one process.
// Copyright (c) 2025 Rotaplay

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

#ifdef ROTAPLAY_CONTROL_SERVICE_AVAILABLE
#include "rotaplay/control/ControlService.hpp"
#endif
#include "rotaplay/library/CacheScanner.hpp"
#include "rotaplay/library/LibraryStore.hpp"
#include "rotaplay/media/FfmpegDurationProbe.hpp"
#include "rotaplay/media/HeadlessMediaSource.hpp"
#include "rotaplay/media/TextFileOverlay.hpp"
#include "rotaplay/runtime/ControlInbox.hpp"
#include "rotaplay/runtime/PlaybackController.hpp"
#include "rotaplay/runtime/PlayerConfig.hpp"
#include "rotaplay/runtime/StatusSnapshot.hpp"
#include "rotaplay/runtime/TickLoop.hpp"
#include "rotaplay/timing/IWaitStrategy.hpp"
#include "rotaplay/timing/SystemTimeSource.hpp"
#include "rotaplay/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace rotaplay;
  using rotaplay::util::Logger;

  const runtime::PlayerArgs args = runtime::ParsePlayerArgs(argc, argv);
  if (args.help) {
    runtime::PrintPlayerUsage(argv[0]);
    return EXIT_SUCCESS;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    runtime::PrintPlayerUsage(argv[0]);
    return EXIT_FAILURE;
  }
  const runtime::PlayerConfig& config = args.config;

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto time_source = std::make_shared<timing::SystemTimeSource>();
  auto store = std::make_shared<library::LibraryStore>(config.min_file_bytes);

  library::CacheScanner scanner(store, config.cache_dir, config.min_file_bytes,
                                config.rescan_interval_ms);
  const library::ScanReport initial = scanner.ScanOnce();
  Logger::Info("[Main] Initial scan: " + std::to_string(initial.found) +
               " item(s) in " + config.cache_dir);
  scanner.Start();

  auto media = std::make_shared<media::HeadlessMediaSource>(
      std::make_shared<media::FfmpegDurationProbe>(), time_source);
  auto overlay_sink = std::make_shared<media::TextFileOverlay>(config.overlay_path);

  auto controller = std::make_shared<runtime::PlaybackController>(
      store, media, overlay_sink, time_source, config.controller);
  auto inbox = std::make_shared<runtime::ControlInbox>();
  auto status_board = std::make_shared<runtime::StatusBoard>();

#ifdef ROTAPLAY_CONTROL_SERVICE_AVAILABLE
  std::unique_ptr<control::ControlServer> server;
  if (config.enable_control_service) {
    auto service = std::make_shared<control::PlayerControlImpl>(inbox, status_board, store);
    server = std::make_unique<control::ControlServer>(service);
    if (!server->Start(config.listen_address)) {
      scanner.Stop();
      return EXIT_FAILURE;
    }
  }
#else
  if (config.enable_control_service) {
    Logger::Warn("[Main] Built without the gRPC control service; --listen ignored");
  }
#endif

  runtime::TickLoop loop(controller, inbox, status_board, time_source,
                         std::make_shared<timing::RealtimeWaitStrategy>(),
                         config.tick_interval_ms);
  loop.RunUntil(g_termination_requested);

#ifdef ROTAPLAY_CONTROL_SERVICE_AVAILABLE
  if (server) server->Stop();
#endif
  scanner.Stop();
  Logger::Info("[Main] Exiting");
  return EXIT_SUCCESS;
}
