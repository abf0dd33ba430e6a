#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "ledger/kernel/services/v1/ledger_query_service.grpc.pb.h"
#include "internal/service/query_service.hpp"

namespace ledger::grpc {

class QueryServer final : public ledger::kernel::services::v1::LedgerQueryService::Service {
public:
  explicit QueryServer(std::shared_ptr<ledger::service::QueryService> svc);

  ::grpc::Status QueryTrace(::grpc::ServerContext*,
                            const ledger::kernel::services::v1::QueryTraceRequest*,
                            ledger::kernel::v1::TraceReconstruction*) override;

  ::grpc::Status QueryEvents(::grpc::ServerContext*,
                             const ledger::kernel::v1::EventFilter*,
                             ledger::kernel::v1::EventList*) override;

  ::grpc::Status QueryFailurePath(::grpc::ServerContext*,
                                  const ledger::kernel::v1::FailureQuery*,
                                  ledger::kernel::v1::FailurePath*) override;

  ::grpc::Status QueryJourney(::grpc::ServerContext*,
                              const ledger::kernel::services::v1::QueryJourneyRequest*,
                              ledger::kernel::v1::Journey*) override;

  ::grpc::Status Status(::grpc::ServerContext*,
                        const ledger::kernel::services::v1::StoreStatusRequest*,
                        ledger::kernel::services::v1::StoreStatus*) override;

private:
  std::shared_ptr<ledger::service::QueryService> service_;
};

}
