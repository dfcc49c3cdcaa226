// Repository: rotaplay
// Component: Control Inbox
// Purpose: Hands mode/visibility/shutdown commands to the tick thread.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/runtime/ControlInbox.hpp"

#include "rotaplay/runtime/PlaybackController.hpp"

namespace rotaplay::runtime {

ControlCommand ControlCommand::SetMode(PlaybackMode mode) {
  ControlCommand command;
  command.kind = Kind::kSetMode;
  command.mode = mode;
  return command;
}

ControlCommand ControlCommand::SetVisible(bool visible) {
  ControlCommand command;
  command.kind = Kind::kSetVisible;
  command.visible = visible;
  return command;
}

ControlCommand ControlCommand::Shutdown() {
  ControlCommand command;
  command.kind = Kind::kShutdown;
  return command;
}

void ControlInbox::Post(const ControlCommand& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back(command);
}

std::vector<ControlCommand> ControlInbox::Drain() {
  std::vector<ControlCommand> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(pending_);
  }
  return drained;
}

std::size_t ControlInbox::ApplyTo(PlaybackController& controller) {
  const auto commands = Drain();
  for (const auto& command : commands) {
    switch (command.kind) {
      case ControlCommand::Kind::kSetMode:
        controller.SetPlaybackMode(command.mode);
        break;
      case ControlCommand::Kind::kSetVisible:
        controller.SetSceneVisible(command.visible);
        break;
      case ControlCommand::Kind::kShutdown:
        controller.RequestShutdown();
        break;
    }
  }
  return commands.size();
}

}  // namespace rotaplay::runtime
