// Repository: rotaplay
// Component: Headless Media Source contract tests
// Purpose: Status model of the in-process host media slot.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <memory>

#include "fixtures/FakeDurationProbe.h"
#include "support/DeterministicTimeSource.hpp"
#include "rotaplay/media/HeadlessMediaSource.hpp"

namespace rotaplay::tests::contracts {
namespace {

using fixtures::FakeDurationProbe;
using media::HeadlessMediaSource;
using media::MediaStatus;

class HeadlessMediaSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    probe_->durations["/cache/a.mp4"] = 10'000;
    probe_->durations["/cache/b.mp4"] = 20'000;
    probe_->durations["/cache/zero.mp4"] = 0;
  }

  std::shared_ptr<DeterministicTimeSource> clock_ =
      std::make_shared<DeterministicTimeSource>(5'000);
  std::shared_ptr<FakeDurationProbe> probe_ = std::make_shared<FakeDurationProbe>();
  HeadlessMediaSource source_{probe_, clock_};
};

TEST_F(HeadlessMediaSourceTest, NothingLoadedReportsNone) {
  EXPECT_TRUE(source_.IsAvailable());
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kNone);
  EXPECT_EQ(source_.GetDurationMs(), 0);
  EXPECT_EQ(source_.GetPositionMs(), 0);
  EXPECT_EQ(source_.GetActiveLocalPath(), "");
}

TEST_F(HeadlessMediaSourceTest, LoadPlaysUntilDurationElapses) {
  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", false));
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kPlaying);
  EXPECT_EQ(source_.GetDurationMs(), 10'000);
  EXPECT_EQ(source_.GetActiveLocalPath(), "/cache/a.mp4");

  clock_->AdvanceMs(4'000);
  EXPECT_EQ(source_.GetPositionMs(), 4'000);
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kPlaying);

  clock_->AdvanceMs(6'000);
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kEnded);

  clock_->AdvanceMs(60'000);
  EXPECT_EQ(source_.GetPositionMs(), 10'000);
}

TEST_F(HeadlessMediaSourceTest, UnprobeableOrEmptyFilesAreRefused) {
  EXPECT_FALSE(source_.SetLocalFile("/cache/unknown.mp4", false));
  EXPECT_FALSE(source_.SetLocalFile("/cache/zero.mp4", false));
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kNone);
  EXPECT_EQ(source_.load_count(), 0);
}

TEST_F(HeadlessMediaSourceTest, SamePathWhilePlayingIsNotReloaded) {
  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", false));
  clock_->AdvanceMs(3'000);
  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", false));
  EXPECT_EQ(source_.load_count(), 1);
  EXPECT_EQ(source_.GetPositionMs(), 3'000);
}

TEST_F(HeadlessMediaSourceTest, ForcedReloadRestartsFromZero) {
  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", false));
  clock_->AdvanceMs(12'000);
  ASSERT_EQ(source_.GetStatus(), MediaStatus::kEnded);

  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", true));
  EXPECT_EQ(source_.load_count(), 2);
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kPlaying);
  EXPECT_EQ(source_.GetPositionMs(), 0);
}

TEST_F(HeadlessMediaSourceTest, StopAndClearReportsStopped) {
  ASSERT_TRUE(source_.SetLocalFile("/cache/b.mp4", false));
  source_.StopAndClear();
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kStopped);
  EXPECT_EQ(source_.GetDurationMs(), 0);
  EXPECT_EQ(source_.GetActiveLocalPath(), "");

  ASSERT_TRUE(source_.SetLocalFile("/cache/a.mp4", false));
  EXPECT_EQ(source_.GetStatus(), MediaStatus::kPlaying);
}

TEST(MediaStatusContract, ToStringNamesEveryStatus) {
  EXPECT_STREQ(media::ToString(MediaStatus::kNone), "NONE");
  EXPECT_STREQ(media::ToString(MediaStatus::kPlaying), "PLAYING");
  EXPECT_STREQ(media::ToString(MediaStatus::kStopped), "STOPPED");
  EXPECT_STREQ(media::ToString(MediaStatus::kEnded), "ENDED");
}

}  // namespace
}  // namespace rotaplay::tests::contracts
