#include "bridge_server.hpp"
#include "grpc_error.hpp"

#include <string>

namespace ledger::grpc {

BridgeServer::BridgeServer(std::shared_ptr<ledger::service::BridgeService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BridgeServer::Publish(::grpc::ServerContext*,
                                     const ledger::kernel::v1::BridgeEnvelope* req,
                                     ledger::kernel::services::v1::PublishResponse* resp) {
  try {
    *resp = service_->Publish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::PublishStream(::grpc::ServerContext* ctx,
                                           ::grpc::ServerReader<ledger::kernel::v1::BridgeEnvelope>* reader,
                                           ledger::kernel::services::v1::PublishStreamResponse* resp) {
  std::string peer_id;
  try {
    ledger::kernel::v1::BridgeEnvelope envelope;
    while (reader->Read(&envelope)) {
      if (peer_id.empty()) peer_id = envelope.peer_id();
      auto published = service_->Publish(envelope);
      resp->set_received(resp->received() + 1);
      if (published.accepted()) resp->set_accepted(resp->accepted() + 1);
      resp->set_last_bridge_seq(envelope.bridge_seq());
    }
    if (!peer_id.empty()) {
      service_->PeerClosed(peer_id, ctx->IsCancelled() ? "stream_cancelled" : "stream_closed");
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    if (!peer_id.empty()) service_->PeerClosed(peer_id, "stream_error");
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::Diagnostics(::grpc::ServerContext*,
                                         const ledger::kernel::services::v1::DiagnosticsRequest*,
                                         ledger::kernel::v1::BridgeDiagnostics* resp) {
  try {
    *resp = service_->Diagnostics();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
