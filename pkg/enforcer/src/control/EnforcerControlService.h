// Repository: Mapcycle-enforcer
// Component: EnforcerControl gRPC Service Implementation
// Purpose: Exposes loop status, on-demand ticks and selection preview over gRPC.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CONTROL_ENFORCER_CONTROL_SERVICE_H_
#define MAPCYCLE_CONTROL_ENFORCER_CONTROL_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "enforcer_control.grpc.pb.h"
#include "enforcer_control.pb.h"
#include "mapcycle/runtime/EnforcementLoop.hpp"

namespace mapcycle {
namespace control {

// Static facts reported by GetStatus.
struct ControlServiceInfo {
  std::string primary_endpoint;
  bool fallback_configured = false;
  std::string timezone;
};

// EnforcerControlImpl implements the service defined in enforcer_control.proto.
// Thin adapter over EnforcementLoop; it never talks to the game server
// itself.
class EnforcerControlImpl final : public v1::EnforcerControl::Service {
 public:
  EnforcerControlImpl(std::shared_ptr<runtime::EnforcementLoop> loop, ControlServiceInfo info);
  ~EnforcerControlImpl() override = default;

  EnforcerControlImpl(const EnforcerControlImpl&) = delete;
  EnforcerControlImpl& operator=(const EnforcerControlImpl&) = delete;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::GetStatusRequest* request,
                         v1::GetStatusResponse* response) override;

  grpc::Status TriggerEnforcement(grpc::ServerContext* context,
                                  const v1::TriggerEnforcementRequest* request,
                                  v1::TriggerEnforcementResponse* response) override;

  grpc::Status PreviewSelection(grpc::ServerContext* context,
                                const v1::PreviewSelectionRequest* request,
                                v1::PreviewSelectionResponse* response) override;

 private:
  std::shared_ptr<runtime::EnforcementLoop> loop_;
  ControlServiceInfo info_;
};

// Owns the grpc::Server hosting EnforcerControlImpl.
class ControlServer {
 public:
  ControlServer(std::string listen_address, std::shared_ptr<EnforcerControlImpl> service);
  ~ControlServer();

  // Returns false (and logs) when the address cannot be bound.
  bool Start();
  void Shutdown();

  // Port actually bound; useful with "host:0".
  int bound_port() const { return bound_port_; }

 private:
  std::string listen_address_;
  std::shared_ptr<EnforcerControlImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  int bound_port_ = 0;
};

}  // namespace control
}  // namespace mapcycle

#endif  // MAPCYCLE_CONTROL_ENFORCER_CONTROL_SERVICE_H_
