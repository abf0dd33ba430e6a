#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "ledger/kernel/services/v1/event_bridge_service.grpc.pb.h"
#include "internal/service/bridge_service.hpp"

namespace ledger::grpc {

class BridgeServer final : public ledger::kernel::services::v1::EventBridgeService::Service {
public:
  explicit BridgeServer(std::shared_ptr<ledger::service::BridgeService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*,
                         const ledger::kernel::v1::BridgeEnvelope*,
                         ledger::kernel::services::v1::PublishResponse*) override;

  // a closed or broken stream is recorded as bridge.disconnected for the peer
  ::grpc::Status PublishStream(::grpc::ServerContext*,
                               ::grpc::ServerReader<ledger::kernel::v1::BridgeEnvelope>*,
                               ledger::kernel::services::v1::PublishStreamResponse*) override;

  ::grpc::Status Diagnostics(::grpc::ServerContext*,
                             const ledger::kernel::services::v1::DiagnosticsRequest*,
                             ledger::kernel::v1::BridgeDiagnostics*) override;

private:
  std::shared_ptr<ledger::service::BridgeService> service_;
};

}
