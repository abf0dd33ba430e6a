#include "client/cpp/ledger_client.h"

#include <chrono>
#include <utility>

#include <grpcpp/client_context.h>

#include "internal/observability/logging.hpp"

namespace ledger::client {

using namespace ledger::kernel::v1;
using namespace ledger::kernel::services::v1;

namespace {

void SetDeadline(::grpc::ClientContext* ctx, int64_t deadline_ms) {
  if (deadline_ms <= 0) return;
  ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(deadline_ms));
}

} // namespace

LedgerClient::LedgerClient(std::shared_ptr<::grpc::Channel> channel, int64_t deadline_ms)
    : query_stub_(LedgerQueryService::NewStub(channel)),
      bridge_stub_(EventBridgeService::NewStub(channel)),
      deadline_ms_(deadline_ms) {
}

::grpc::Status LedgerClient::QueryTrace(const QueryTraceRequest& request, TraceReconstruction* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return query_stub_->QueryTrace(&ctx, request, response);
}

::grpc::Status LedgerClient::QueryEvents(const EventFilter& request, EventList* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return query_stub_->QueryEvents(&ctx, request, response);
}

::grpc::Status LedgerClient::QueryFailurePath(const FailureQuery& request, FailurePath* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return query_stub_->QueryFailurePath(&ctx, request, response);
}

::grpc::Status LedgerClient::QueryJourney(const QueryJourneyRequest& request, Journey* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return query_stub_->QueryJourney(&ctx, request, response);
}

::grpc::Status LedgerClient::Status(StoreStatus* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return query_stub_->Status(&ctx, StoreStatusRequest{}, response);
}

::grpc::Status LedgerClient::Publish(const BridgeEnvelope& envelope, PublishResponse* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return bridge_stub_->Publish(&ctx, envelope, response);
}

::grpc::Status LedgerClient::Diagnostics(BridgeDiagnostics* response) const {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, deadline_ms_);
  return bridge_stub_->Diagnostics(&ctx, DiagnosticsRequest{}, response);
}

GrpcBridgeTransport::GrpcBridgeTransport(std::shared_ptr<::grpc::Channel> channel, int64_t deadline_ms)
    : channel_(channel), client_(std::move(channel), deadline_ms) {
}

bool GrpcBridgeTransport::Connected() const {
  const auto state = channel_->GetState(true);
  return state != GRPC_CHANNEL_TRANSIENT_FAILURE && state != GRPC_CHANNEL_SHUTDOWN;
}

bool GrpcBridgeTransport::Send(const BridgeEnvelope& envelope) {
  PublishResponse response;
  auto            status = client_.Publish(envelope, &response);
  if (!status.ok()) {
    last_error_ = status.error_message();
    LEDGER_LOG_WARN("bridge publish failed", {observability::StringField("error", status.error_message()),
                                              observability::IntField("code", static_cast<int64_t>(status.error_code()))});
    return false;
  }
  if (!response.accepted()) {
    last_error_ = "rejected: " + response.reason();
    LEDGER_LOG_WARN("bridge envelope rejected by daemon", {observability::StringField("reason", response.reason())});
    return false;
  }
  last_error_.clear();
  return true;
}

} // namespace ledger::client
