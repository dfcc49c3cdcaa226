// Repository: rotaplay
// Component: Tick Loop contract tests
// Purpose: Cadence, command hand-off and orderly shutdown of the host loop,
//          driven end to end on a virtual clock.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "fixtures/FakeDurationProbe.h"
#include "fixtures/FakeMediaSource.h"
#include "fixtures/RecordingOverlaySink.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "rotaplay/library/LibraryStore.hpp"
#include "rotaplay/media/HeadlessMediaSource.hpp"
#include "rotaplay/runtime/ControlInbox.hpp"
#include "rotaplay/runtime/PlaybackController.hpp"
#include "rotaplay/runtime/StatusSnapshot.hpp"
#include "rotaplay/runtime/TickLoop.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::tests::contracts {
namespace {

namespace fs = std::filesystem;

using fixtures::FakeDurationProbe;
using fixtures::RecordingOverlaySink;
using runtime::ControlCommand;
using runtime::ControlInbox;
using runtime::PlaybackController;
using runtime::PlaybackMode;
using runtime::StatusBoard;
using runtime::TickLoop;
using util::Logger;

class TickLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("rotaplay_tickloop_" + std::to_string(getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    Logger::SetErrorSink(nullptr);
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void AddItem(const std::string& id, int64_t duration_ms) {
    const std::string path = (dir_ / (id + ".mp4")).string();
    std::ofstream(path) << "media bytes";
    probe_->durations[path] = duration_ms;
    library::LibraryItem item;
    item.id = id;
    item.local_path = path;
    item.title = "Song " + id;
    item.artist = "Band";
    store_->Put(item);
  }

  void Build() {
    runtime::ControllerConfig config;
    config.rng_seed = 7;
    controller_ = std::make_shared<PlaybackController>(store_, media_, sink_, clock_,
                                                       config);
    loop_ = std::make_unique<TickLoop>(controller_, inbox_, board_, clock_, wait_, 1000);
  }

  fs::path dir_;
  std::shared_ptr<DeterministicTimeSource> clock_ =
      std::make_shared<DeterministicTimeSource>(0);
  std::shared_ptr<DeterministicWaitStrategy> wait_ =
      std::make_shared<DeterministicWaitStrategy>(clock_);
  std::shared_ptr<library::LibraryStore> store_ =
      std::make_shared<library::LibraryStore>(1);
  std::shared_ptr<FakeDurationProbe> probe_ = std::make_shared<FakeDurationProbe>();
  std::shared_ptr<media::HeadlessMediaSource> media_ =
      std::make_shared<media::HeadlessMediaSource>(probe_, clock_);
  std::shared_ptr<RecordingOverlaySink> sink_ = std::make_shared<RecordingOverlaySink>();
  std::shared_ptr<ControlInbox> inbox_ = std::make_shared<ControlInbox>();
  std::shared_ptr<StatusBoard> board_ = std::make_shared<StatusBoard>();
  std::shared_ptr<PlaybackController> controller_;
  std::unique_ptr<TickLoop> loop_;
};

TEST_F(TickLoopTest, TicksOncePerIntervalAndWakesForCommands) {
  Build();
  std::atomic<bool> terminate{false};
  wait_->SetOnWait([&](std::size_t waits) {
    if (waits == 25) terminate = true;
  });

  loop_->RunUntil(terminate);

  // Ticks at 0, 1000, 2000, plus the shutdown tick.
  EXPECT_EQ(loop_->tick_count(), 4u);
  ASSERT_FALSE(wait_->deadlines().empty());
  EXPECT_EQ(wait_->deadlines().front(), 100);
  for (std::size_t i = 1; i < wait_->deadlines().size(); ++i) {
    EXPECT_EQ(wait_->deadlines()[i] - wait_->deadlines()[i - 1], 100);
  }
  EXPECT_TRUE(controller_->shutdown_requested());
  EXPECT_TRUE(board_->Latest().shutdown_requested);
}

TEST_F(TickLoopTest, InboxCommandsApplyInPostingOrder) {
  AddItem("a", 60'000);
  Build();

  inbox_->Post(ControlCommand::SetMode(PlaybackMode::kSingle));
  inbox_->Post(ControlCommand::SetVisible(false));
  inbox_->Post(ControlCommand::SetMode(PlaybackMode::kLoop));
  EXPECT_EQ(inbox_->ApplyTo(*controller_), 3u);
  EXPECT_EQ(controller_->playback_mode(), PlaybackMode::kLoop);
  EXPECT_FALSE(controller_->scene_visible());
  EXPECT_TRUE(inbox_->Drain().empty());
}

TEST_F(TickLoopTest, ShutdownCommandStopsPlaybackAndEndsLoop) {
  AddItem("a", 60'000);
  Build();
  std::atomic<bool> terminate{false};
  wait_->SetOnWait([&](std::size_t waits) {
    if (waits == 5) inbox_->Post(ControlCommand::Shutdown());
    if (waits > 50) terminate = true;  // safety net
  });

  loop_->RunUntil(terminate);

  EXPECT_FALSE(terminate.load());
  EXPECT_EQ(wait_->deadlines().size(), 5u);
  EXPECT_FALSE(controller_->state().is_playing);
  EXPECT_EQ(media_->GetStatus(), media::MediaStatus::kStopped);
  EXPECT_EQ(sink_->current_text, "");

  const auto status = board_->Latest();
  EXPECT_TRUE(status.shutdown_requested);
  EXPECT_FALSE(status.is_playing);
}

TEST_F(TickLoopTest, RotatesThroughLibraryOnVirtualClock) {
  AddItem("a", 10'000);
  AddItem("b", 10'000);
  Build();
  std::atomic<bool> terminate{false};
  runtime::StatusSnapshot mid;
  wait_->SetOnWait([&](std::size_t) {
    if (clock_->NowMs() == 3'000) mid = board_->Latest();
    if (clock_->NowMs() >= 12'000) terminate = true;
  });

  loop_->RunUntil(terminate);

  EXPECT_EQ(media_->load_count(), 2);
  EXPECT_NE(std::find(sink_->texts.begin(), sink_->texts.end(), "Song a - Band"),
            sink_->texts.end());
  EXPECT_NE(std::find(sink_->texts.begin(), sink_->texts.end(), "Song b - Band"),
            sink_->texts.end());
  EXPECT_EQ(sink_->opacities.back(), 0);

  EXPECT_TRUE(mid.is_playing);
  EXPECT_EQ(mid.host_status, media::MediaStatus::kPlaying);
  EXPECT_EQ(mid.library_size, 2u);
  EXPECT_EQ(mid.overlay_opacity, 100);
  EXPECT_FALSE(mid.current_item_id.empty());
}

TEST_F(TickLoopTest, HostErrorsWhilePublishingDoNotEndTheLoop) {
  AddItem("a", 60'000);
  auto host = std::make_shared<fixtures::FakeMediaSource>();
  host->throw_on_status = true;
  runtime::ControllerConfig config;
  config.rng_seed = 7;
  controller_ = std::make_shared<PlaybackController>(store_, host, sink_, clock_, config);
  loop_ = std::make_unique<TickLoop>(controller_, inbox_, board_, clock_, wait_, 1000);

  std::vector<std::string> errors;
  Logger::SetErrorSink([&](const std::string& line) { errors.push_back(line); });
  std::atomic<bool> terminate{false};
  wait_->SetOnWait([&](std::size_t waits) {
    if (waits == 15) terminate = true;
  });

  EXPECT_NO_THROW(loop_->RunUntil(terminate));
  EXPECT_EQ(loop_->tick_count(), 3u);
  EXPECT_TRUE(controller_->shutdown_requested());
  EXPECT_NE(std::find_if(errors.begin(), errors.end(),
                         [](const std::string& line) {
                           return line.find("[TickLoop] Status publish failed") !=
                                  std::string::npos;
                         }),
            errors.end());
  EXPECT_FALSE(board_->Latest().shutdown_requested);
}

}  // namespace
}  // namespace rotaplay::tests::contracts
