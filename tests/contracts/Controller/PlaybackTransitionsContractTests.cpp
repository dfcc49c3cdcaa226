// Repository: rotaplay
// Component: Transition table contract tests
// Purpose: First-match semantics and the named guards of each status.
// Copyright (c) 2025 Rotaplay

#include <gtest/gtest.h>

#include <set>

#include "rotaplay/runtime/PlaybackTransitions.hpp"

namespace rotaplay::tests::contracts {
namespace {

using media::MediaStatus;
using runtime::Decide;
using runtime::PlaybackMode;
using runtime::TickAction;
using runtime::TransitionInput;

TransitionInput Playing(MediaStatus status) {
  TransitionInput in;
  in.status = status;
  in.is_playing = true;
  in.library_empty = false;
  return in;
}

TEST(PlaybackTransitionsTest, EveryStatusHasACatchAllRow) {
  std::set<MediaStatus> covered;
  for (const auto& row : runtime::TransitionTable()) {
    if (std::string(row.guard_name) == "always") covered.insert(row.status);
  }
  EXPECT_EQ(covered.size(), 4u);
}

TEST(PlaybackTransitionsTest, PlayingSyncsOrTracks) {
  auto in = Playing(MediaStatus::kPlaying);
  EXPECT_EQ(Decide(in).action, TickAction::kTrackProgress);
  in.is_playing = false;
  EXPECT_EQ(Decide(in).action, TickAction::kSyncPlaying);
}

TEST(PlaybackTransitionsTest, EndedRows) {
  auto in = Playing(MediaStatus::kEnded);
  EXPECT_EQ(Decide(in).action, TickAction::kStartNext);

  in.mode = PlaybackMode::kLoop;
  EXPECT_EQ(Decide(in).action, TickAction::kScheduleLoopRestart);
  in.loop_restart_pending = true;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);
  EXPECT_STREQ(Decide(in).guard_name, "loop_restart_pending");

  in = Playing(MediaStatus::kEnded);
  in.mode = PlaybackMode::kSingle;
  EXPECT_EQ(Decide(in).action, TickAction::kStartNext);
  in.first_item_played = true;
  EXPECT_EQ(Decide(in).action, TickAction::kFullStop);

  in.is_playing = false;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);
}

TEST(PlaybackTransitionsTest, AdoptedItemCountsAsSingleModeItem) {
  auto in = Playing(MediaStatus::kEnded);
  in.mode = PlaybackMode::kSingle;
  in.adopted_item = true;
  EXPECT_EQ(Decide(in).action, TickAction::kFullStop);
}

TEST(PlaybackTransitionsTest, StoppedRows) {
  auto in = Playing(MediaStatus::kStopped);
  EXPECT_EQ(Decide(in).action, TickAction::kDetectManualStop);

  in.manual_stop_flag = true;
  in.retry_count = 2;
  EXPECT_EQ(Decide(in).action, TickAction::kRetryStart);
  in.retry_count = 3;
  EXPECT_EQ(Decide(in).action, TickAction::kFullStop);

  in.is_playing = false;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);
}

TEST(PlaybackTransitionsTest, NoneRows) {
  TransitionInput in;
  in.status = MediaStatus::kNone;
  in.library_empty = false;
  EXPECT_EQ(Decide(in).action, TickAction::kStartFresh);

  in.mode = PlaybackMode::kSingle;
  in.first_item_played = true;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);

  in = TransitionInput();
  in.status = MediaStatus::kNone;
  in.library_empty = true;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);

  in = Playing(MediaStatus::kNone);
  in.none_grace_elapsed = false;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);
  EXPECT_STREQ(Decide(in).guard_name, "within_none_grace");
  in.none_grace_elapsed = true;
  EXPECT_EQ(Decide(in).action, TickAction::kResetDesync);

  in.visible = false;
  EXPECT_EQ(Decide(in).action, TickAction::kNoop);
}

}  // namespace
}  // namespace rotaplay::tests::contracts
