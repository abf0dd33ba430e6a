#include "query_server.hpp"
#include "grpc_error.hpp"

namespace ledger::grpc {

QueryServer::QueryServer(std::shared_ptr<ledger::service::QueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status QueryServer::QueryTrace(::grpc::ServerContext*,
                                       const ledger::kernel::services::v1::QueryTraceRequest* req,
                                       ledger::kernel::v1::TraceReconstruction* resp) {
  try {
    *resp = service_->QueryTrace(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::QueryEvents(::grpc::ServerContext*,
                                        const ledger::kernel::v1::EventFilter* req,
                                        ledger::kernel::v1::EventList* resp) {
  try {
    *resp = service_->QueryEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::QueryFailurePath(::grpc::ServerContext*,
                                             const ledger::kernel::v1::FailureQuery* req,
                                             ledger::kernel::v1::FailurePath* resp) {
  try {
    *resp = service_->QueryFailurePath(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::QueryJourney(::grpc::ServerContext*,
                                         const ledger::kernel::services::v1::QueryJourneyRequest* req,
                                         ledger::kernel::v1::Journey* resp) {
  try {
    *resp = service_->QueryJourney(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::Status(::grpc::ServerContext*,
                                   const ledger::kernel::services::v1::StoreStatusRequest*,
                                   ledger::kernel::services::v1::StoreStatus* resp) {
  try {
    *resp = service_->Status();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
