// Repository: rotaplay
// Component: Title Overlay contract tests
// Purpose: Show/clear timing, fade ramp, cancel-and-replace timers.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <memory>

#include "fixtures/FakeMediaSource.h"
#include "fixtures/RecordingOverlaySink.h"
#include "support/DeterministicTimeSource.hpp"
#include "rotaplay/overlay/TitleOverlay.hpp"
#include "rotaplay/runtime/CooperativeScheduler.hpp"

namespace rotaplay::tests::contracts {
namespace {

using fixtures::FakeMediaSource;
using fixtures::RecordingOverlaySink;
using overlay::FadeDirection;
using overlay::TitleOverlay;

class TitleOverlayTest : public ::testing::Test {
 protected:
  // Advances the clock in 10 ms steps, delivering due timers as the tick
  // loop would.
  void Run(int64_t ms) {
    for (int64_t t = 0; t < ms; t += 10) {
      clock_->AdvanceMs(10);
      while (auto due = scheduler_.PopDue()) overlay_.OnTimer(*due);
    }
  }

  library::LibraryItem Item() {
    library::LibraryItem item;
    item.id = "dQw4w9WgXcQ";
    item.local_path = "/cache/x.mp4";
    item.title = "Song";
    item.artist = "Artist";
    return item;
  }

  std::shared_ptr<DeterministicTimeSource> clock_ =
      std::make_shared<DeterministicTimeSource>(0);
  runtime::CooperativeScheduler scheduler_{clock_};
  RecordingOverlaySink sink_;
  FakeMediaSource media_;
  TitleOverlay overlay_{sink_, scheduler_, media_};
};

TEST_F(TitleOverlayTest, BeginItemBlanksThenShowsAfterDelay) {
  media_.duration_ms = 0;
  overlay_.BeginItem(Item());
  EXPECT_EQ(sink_.current_text, "");
  EXPECT_EQ(sink_.current_opacity, 0);
  EXPECT_TRUE(overlay_.IsShowPending());

  Run(1490);
  EXPECT_EQ(sink_.current_text, "");

  Run(20);
  EXPECT_EQ(sink_.current_text, "Song - Artist");
  EXPECT_EQ(overlay_.fade_direction(), FadeDirection::kIn);

  Run(1100);
  EXPECT_EQ(sink_.current_opacity, 100);
  EXPECT_DOUBLE_EQ(overlay_.opacity(), 100.0);
  EXPECT_FALSE(overlay_.IsFading());
  EXPECT_FALSE(overlay_.fade_direction().has_value());
}

TEST_F(TitleOverlayTest, DegradedMetadataIsMarked) {
  auto item = Item();
  item.metadata_degraded = true;
  overlay_.BeginItem(item);
  Run(1600);
  EXPECT_EQ(sink_.current_text, "Song - Artist ⚠");
}

TEST_F(TitleOverlayTest, DurationPollPlacesClearBeforeEnd) {
  media_.duration_ms = 0;
  overlay_.BeginItem(Item());
  Run(1000);
  EXPECT_FALSE(overlay_.IsClearScheduled());

  // Duration becomes known; the next 500 ms poll picks it up.
  media_.duration_ms = 20'000;
  Run(500);
  // Poll at t=1200 saw 20 s, so the clear lands at 1200 + 20000 - 3500.
  ASSERT_TRUE(overlay_.IsClearScheduled());
  Run(16'100);
  EXPECT_TRUE(overlay_.IsClearScheduled());
  Run(200);
  EXPECT_FALSE(overlay_.IsClearScheduled());
  EXPECT_EQ(overlay_.fade_direction(), FadeDirection::kOut);
  Run(1100);
  EXPECT_EQ(sink_.current_opacity, 0);
}

TEST_F(TitleOverlayTest, NewClearReplacesOutstandingClear) {
  overlay_.ScheduleClearForDuration(60'000);
  const auto first = overlay_.clear_timer();
  overlay_.ScheduleClearFromRemaining(30'000);
  const auto second = overlay_.clear_timer();

  EXPECT_NE(first, second);
  EXPECT_FALSE(scheduler_.IsPending(first));
  EXPECT_TRUE(scheduler_.IsPending(second));
  EXPECT_EQ(scheduler_.PendingCount(), 1u);
}

TEST_F(TitleOverlayTest, ClearFromRemainingFadesNowWhenLeadHasPassed) {
  overlay_.SwapText("Song", "Artist", false);
  Run(1100);
  ASSERT_EQ(sink_.current_opacity, 100);

  overlay_.ScheduleClearFromRemaining(2000);
  EXPECT_FALSE(overlay_.IsClearScheduled());
  EXPECT_EQ(overlay_.fade_direction(), FadeDirection::kOut);
}

TEST_F(TitleOverlayTest, ClearFromRemainingAtZeroOpacityDoesNothing) {
  overlay_.ScheduleClearFromRemaining(1000);
  EXPECT_FALSE(overlay_.IsClearScheduled());
  EXPECT_FALSE(overlay_.IsFading());
}

TEST_F(TitleOverlayTest, FadeRampTakesTwentyStepsOfFiftyMs) {
  overlay_.FadeIn();
  Run(500);
  EXPECT_NEAR(overlay_.opacity(), 50.0, 0.001);
  Run(500);
  EXPECT_DOUBLE_EQ(overlay_.opacity(), 100.0);
  EXPECT_FALSE(overlay_.IsFading());
}

TEST_F(TitleOverlayTest, FadeOutIsNoopAtZeroOrWhileFadingOut) {
  overlay_.FadeOut();
  EXPECT_FALSE(overlay_.IsFading());

  overlay_.FadeIn();
  Run(1000);
  overlay_.FadeOut();
  Run(200);
  const double mid = overlay_.opacity();
  overlay_.FadeOut();  // must not restart the ramp
  Run(50);
  EXPECT_LT(overlay_.opacity(), mid);
  Run(1000);
  EXPECT_DOUBLE_EQ(overlay_.opacity(), 0.0);
}

TEST_F(TitleOverlayTest, SwapWhileVisibleFadesOutThenIn) {
  overlay_.SwapText("First", "One", false);
  Run(1000);
  ASSERT_EQ(sink_.current_text, "First - One");

  overlay_.SwapText("Second", "Two", false);
  EXPECT_EQ(overlay_.fade_direction(), FadeDirection::kOut);
  EXPECT_EQ(sink_.current_text, "First - One");

  Run(1000);
  EXPECT_EQ(sink_.current_text, "Second - Two");
  EXPECT_EQ(overlay_.fade_direction(), FadeDirection::kIn);
  Run(1000);
  EXPECT_EQ(sink_.current_opacity, 100);
}

TEST_F(TitleOverlayTest, SwapToEmptyTextDoesNotFadeIn) {
  overlay_.SwapText("", "", false);
  EXPECT_FALSE(overlay_.IsFading());
  EXPECT_EQ(sink_.current_text, "");
}

TEST_F(TitleOverlayTest, CancelAllIsIdempotentAndStopsShow) {
  overlay_.BeginItem(Item());
  overlay_.CancelAll();
  overlay_.CancelAll();
  EXPECT_FALSE(overlay_.IsShowPending());
  EXPECT_FALSE(overlay_.pending_title().has_value());
  Run(3000);
  EXPECT_EQ(sink_.current_text, "");
}

TEST_F(TitleOverlayTest, ClearNowBlanksAndCancelsEverything) {
  overlay_.BeginItem(Item());
  Run(2000);
  overlay_.ClearNow();
  EXPECT_EQ(sink_.current_text, "");
  EXPECT_EQ(sink_.current_opacity, 0);
  EXPECT_EQ(scheduler_.PendingCount(), 0u);
}

}  // namespace
}  // namespace rotaplay::tests::contracts
