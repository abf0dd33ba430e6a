#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/bridge/transport.hpp"
#include "ledger/kernel/services/v1/event_bridge_service.grpc.pb.h"
#include "ledger/kernel/services/v1/ledger_query_service.grpc.pb.h"

namespace ledger::client {

/*
  Thin synchronous client for ledgerd. Calls return the gRPC status and
  fill the response on success.
*/
class LedgerClient {
 public:
  explicit LedgerClient(std::shared_ptr<::grpc::Channel> channel, int64_t deadline_ms = 5000);

  ::grpc::Status QueryTrace(const ledger::kernel::services::v1::QueryTraceRequest& request,
                          ledger::kernel::v1::TraceReconstruction*               response) const;

  ::grpc::Status QueryEvents(const ledger::kernel::v1::EventFilter& request, ledger::kernel::v1::EventList* response) const;

  ::grpc::Status QueryFailurePath(const ledger::kernel::v1::FailureQuery& request,
                                ledger::kernel::v1::FailurePath*        response) const;

  ::grpc::Status QueryJourney(const ledger::kernel::services::v1::QueryJourneyRequest& request,
                            ledger::kernel::v1::Journey*                             response) const;

  ::grpc::Status Status(ledger::kernel::services::v1::StoreStatus* response) const;

  ::grpc::Status Publish(const ledger::kernel::v1::BridgeEnvelope&      envelope,
                       ledger::kernel::services::v1::PublishResponse* response) const;

  ::grpc::Status Diagnostics(ledger::kernel::v1::BridgeDiagnostics* response) const;

 private:
  std::unique_ptr<ledger::kernel::services::v1::LedgerQueryService::Stub> query_stub_;
  std::unique_ptr<ledger::kernel::services::v1::EventBridgeService::Stub> bridge_stub_;
  int64_t                                                                 deadline_ms_;
};

/*
  Bridge transport over the daemon's EventBridgeService. Connected() asks
  the channel, so a BridgeSender holds envelopes while the daemon is down.
*/
class GrpcBridgeTransport final : public ledger::bridge::BridgeTransport {
 public:
  explicit GrpcBridgeTransport(std::shared_ptr<::grpc::Channel> channel, int64_t deadline_ms = 2000);

  bool Connected() const override;
  bool Send(const ledger::kernel::v1::BridgeEnvelope& envelope) override;

  // transport error or daemon rejection reason of the last failed Send
  const std::string& last_error() const { return last_error_; }

 private:
  std::shared_ptr<::grpc::Channel> channel_;
  LedgerClient                   client_;
  std::string                    last_error_;
};

} // namespace ledger::client
