// Repository: rotaplay
// Component: PlayerControl gRPC Service
// Purpose: Remote control surface implementation.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/control/ControlService.hpp"

#include <optional>

#include "rotaplay/library/LibraryItem.hpp"
#include "rotaplay/library/LibraryStore.hpp"
#include "rotaplay/runtime/ControlInbox.hpp"
#include "rotaplay/runtime/StatusSnapshot.hpp"
#include "rotaplay/util/Logger.hpp"

namespace rotaplay::control {

using rotaplay::runtime::ControlCommand;
using rotaplay::runtime::PlaybackMode;
using rotaplay::util::Logger;

namespace {

std::optional<PlaybackMode> FromProto(v1::PlaybackMode mode) {
  switch (mode) {
    case v1::PLAYBACK_MODE_CONTINUOUS:
      return PlaybackMode::kContinuous;
    case v1::PLAYBACK_MODE_SINGLE:
      return PlaybackMode::kSingle;
    case v1::PLAYBACK_MODE_LOOP:
      return PlaybackMode::kLoop;
    default:
      return std::nullopt;
  }
}

v1::PlaybackMode ToProto(PlaybackMode mode) {
  switch (mode) {
    case PlaybackMode::kContinuous:
      return v1::PLAYBACK_MODE_CONTINUOUS;
    case PlaybackMode::kSingle:
      return v1::PLAYBACK_MODE_SINGLE;
    case PlaybackMode::kLoop:
      return v1::PLAYBACK_MODE_LOOP;
  }
  return v1::PLAYBACK_MODE_UNSPECIFIED;
}

v1::MediaStatus ToProto(media::MediaStatus status) {
  switch (status) {
    case media::MediaStatus::kNone:
      return v1::MEDIA_STATUS_NONE;
    case media::MediaStatus::kPlaying:
      return v1::MEDIA_STATUS_PLAYING;
    case media::MediaStatus::kStopped:
      return v1::MEDIA_STATUS_STOPPED;
    case media::MediaStatus::kEnded:
      return v1::MEDIA_STATUS_ENDED;
  }
  return v1::MEDIA_STATUS_NONE;
}

}  // namespace

PlayerControlImpl::PlayerControlImpl(
    std::shared_ptr<runtime::ControlInbox> inbox,
    std::shared_ptr<runtime::StatusBoard> status_board,
    std::shared_ptr<library::LibraryStore> store)
    : inbox_(std::move(inbox)),
      status_board_(std::move(status_board)),
      store_(std::move(store)) {
  Logger::Info(std::string("[PlayerControlImpl] Service initialized (API version: ") +
               kApiVersion + ")");
}

PlayerControlImpl::~PlayerControlImpl() {
  Logger::Info("[PlayerControlImpl] Service shutting down");
}

grpc::Status PlayerControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                           const v1::ApiVersionRequest* /*request*/,
                                           v1::ApiVersion* response) {
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::SetPlaybackMode(
    grpc::ServerContext* /*context*/, const v1::SetPlaybackModeRequest* request,
    v1::ControlResponse* response) {
  const auto mode = FromProto(request->mode());
  if (!mode) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "playback mode must be CONTINUOUS, SINGLE or LOOP");
  }
  Logger::Info(std::string("[SetPlaybackMode] Request received: mode=") +
               runtime::ToString(*mode));
  inbox_->Post(ControlCommand::SetMode(*mode));
  response->set_success(true);
  response->set_message("queued");
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::SetSceneVisible(
    grpc::ServerContext* /*context*/, const v1::SetSceneVisibleRequest* request,
    v1::ControlResponse* response) {
  Logger::Info(std::string("[SetSceneVisible] Request received: visible=") +
               (request->visible() ? "true" : "false"));
  inbox_->Post(ControlCommand::SetVisible(request->visible()));
  response->set_success(true);
  response->set_message("queued");
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::Shutdown(grpc::ServerContext* /*context*/,
                                         const v1::ShutdownRequest* /*request*/,
                                         v1::ControlResponse* response) {
  Logger::Info("[Shutdown] Request received");
  inbox_->Post(ControlCommand::Shutdown());
  response->set_success(true);
  response->set_message("queued");
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                          const v1::GetStatusRequest* /*request*/,
                                          v1::PlayerStatus* response) {
  const runtime::StatusSnapshot snap = status_board_->Latest();
  response->set_mode(ToProto(snap.mode));
  response->set_scene_visible(snap.scene_visible);
  response->set_is_playing(snap.is_playing);
  response->set_host_status(ToProto(snap.host_status));
  response->set_current_item_id(snap.current_item_id);
  response->set_display_text(snap.display_text);
  response->set_loop_item_id(snap.loop_item_id);
  response->set_position_ms(snap.position_ms);
  response->set_duration_ms(snap.duration_ms);
  response->set_library_size(snap.library_size);
  response->set_played_count(snap.played_count);
  response->set_retry_count(snap.retry_count);
  response->set_first_item_played(snap.first_item_played);
  response->set_shutdown_requested(snap.shutdown_requested);
  response->set_overlay_opacity(snap.overlay_opacity);
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::PutItem(grpc::ServerContext* /*context*/,
                                        const v1::PutItemRequest* request,
                                        v1::ControlResponse* response) {
  if (request->id().empty() || request->local_path().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "id and local_path are required");
  }

  library::LibraryItem item;
  item.id = request->id();
  item.local_path = request->local_path();
  item.title = request->title();
  item.artist = request->artist();
  item.metadata_degraded = request->metadata_degraded();
  store_->Put(item);

  Logger::Info("[PutItem] Added " + item.id + " (" + item.local_path + ")");
  response->set_success(true);
  response->set_message("added");
  return grpc::Status::OK;
}

grpc::Status PlayerControlImpl::RemoveItem(grpc::ServerContext* /*context*/,
                                           const v1::RemoveItemRequest* request,
                                           v1::RemoveItemResponse* response) {
  if (request->id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "id is required");
  }

  switch (store_->Remove(request->id())) {
    case library::RemoveResult::kRemoved:
      response->set_success(true);
      response->set_message("removed");
      break;
    case library::RemoveResult::kDeferred:
      response->set_success(true);
      response->set_deferred(true);
      response->set_message("item is playing, removal deferred");
      break;
    case library::RemoveResult::kNotFound:
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "no such item: " + request->id());
  }
  Logger::Info("[RemoveItem] " + request->id() + ": " + response->message());
  return grpc::Status::OK;
}

// =============================================================================
// ControlServer
// =============================================================================

ControlServer::ControlServer(std::shared_ptr<PlayerControlImpl> service)
    : service_(std::move(service)) {}

ControlServer::~ControlServer() { Stop(); }

bool ControlServer::Start(const std::string& listen_address) {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials(),
                           &bound_port_);
  builder.RegisterService(service_.get());
  server_ = builder.BuildAndStart();
  if (!server_ || bound_port_ == 0) {
    Logger::Error("[ControlServer] Failed to listen on " + listen_address);
    server_.reset();
    return false;
  }
  Logger::Info("[ControlServer] Listening on " + listen_address + " (port " +
               std::to_string(bound_port_) + ")");
  return true;
}

void ControlServer::Stop() {
  if (!server_) return;
  server_->Shutdown();
  server_->Wait();
  server_.reset();
  Logger::Info("[ControlServer] Stopped");
}

}  // namespace rotaplay::control
