// Repository: rotaplay
// Component: PlayerControl gRPC Service
// Purpose: Remote control surface. Thin adapter onto the control inbox, the
//          status board and the library store.
// Copyright (c) 2025 Rotaplay

#ifndef ROTAPLAY_CONTROL_CONTROL_SERVICE_HPP_
#define ROTAPLAY_CONTROL_CONTROL_SERVICE_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "rotaplay_control.grpc.pb.h"
#include "rotaplay_control.pb.h"

namespace rotaplay::library {
class LibraryStore;
}  // namespace rotaplay::library

namespace rotaplay::runtime {
class ControlInbox;
class StatusBoard;
}  // namespace rotaplay::runtime

namespace rotaplay::control {

constexpr char kApiVersion[] = "1.0.0";

// Handlers run on gRPC threads. None of them touches the controller:
// commands are posted to the inbox and the tick thread applies them.
class PlayerControlImpl final : public v1::PlayerControl::Service {
 public:
  PlayerControlImpl(std::shared_ptr<runtime::ControlInbox> inbox,
                    std::shared_ptr<runtime::StatusBoard> status_board,
                    std::shared_ptr<library::LibraryStore> store);
  ~PlayerControlImpl() override;

  PlayerControlImpl(const PlayerControlImpl&) = delete;
  PlayerControlImpl& operator=(const PlayerControlImpl&) = delete;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

  grpc::Status SetPlaybackMode(grpc::ServerContext* context,
                               const v1::SetPlaybackModeRequest* request,
                               v1::ControlResponse* response) override;

  grpc::Status SetSceneVisible(grpc::ServerContext* context,
                               const v1::SetSceneVisibleRequest* request,
                               v1::ControlResponse* response) override;

  grpc::Status Shutdown(grpc::ServerContext* context,
                        const v1::ShutdownRequest* request,
                        v1::ControlResponse* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::GetStatusRequest* request,
                         v1::PlayerStatus* response) override;

  grpc::Status PutItem(grpc::ServerContext* context,
                       const v1::PutItemRequest* request,
                       v1::ControlResponse* response) override;

  grpc::Status RemoveItem(grpc::ServerContext* context,
                          const v1::RemoveItemRequest* request,
                          v1::RemoveItemResponse* response) override;

 private:
  std::shared_ptr<runtime::ControlInbox> inbox_;
  std::shared_ptr<runtime::StatusBoard> status_board_;
  std::shared_ptr<library::LibraryStore> store_;
};

// Owns the grpc::Server for one PlayerControlImpl.
class ControlServer {
 public:
  explicit ControlServer(std::shared_ptr<PlayerControlImpl> service);
  ~ControlServer();

  // Returns false if the address could not be bound.
  bool Start(const std::string& listen_address);
  void Stop();

  // Port actually bound (useful with ":0").
  int bound_port() const { return bound_port_; }

 private:
  std::shared_ptr<PlayerControlImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  int bound_port_ = 0;
};

}  // namespace rotaplay::control

#endif  // ROTAPLAY_CONTROL_CONTROL_SERVICE_HPP_
