// Repository: rotaplay
// Component: Control Inbox
// Purpose: Hands mode/visibility/shutdown commands from other threads to the
//          tick thread.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_RUNTIME_CONTROL_INBOX_HPP_
#define ROTAPLAY_RUNTIME_CONTROL_INBOX_HPP_

#include <mutex>
#include <vector>

#include "rotaplay/runtime/PlaybackTypes.hpp"

namespace rotaplay::runtime {

class PlaybackController;

struct ControlCommand {
  enum class Kind { kSetMode, kSetVisible, kShutdown };

  Kind kind = Kind::kShutdown;
  PlaybackMode mode = PlaybackMode::kContinuous;
  bool visible = true;

  static ControlCommand SetMode(PlaybackMode mode);
  static ControlCommand SetVisible(bool visible);
  static ControlCommand Shutdown();
};

// Multi-producer, single-consumer. Producers Post() from any thread; the
// tick loop calls ApplyTo() once per iteration, so commands take effect in
// posting order and never race a tick.
class ControlInbox {
 public:
  void Post(const ControlCommand& command);

  // Moves out everything posted so far.
  std::vector<ControlCommand> Drain();

  // Drains and applies to the controller. Returns the number applied.
  std::size_t ApplyTo(PlaybackController& controller);

 private:
  std::mutex mutex_;
  std::vector<ControlCommand> pending_;
};

}  // namespace rotaplay::runtime

#endif  // ROTAPLAY_RUNTIME_CONTROL_INBOX_HPP_
