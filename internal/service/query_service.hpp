#pragma once

#include "ledger/kernel/services/v1/ledger_query_service.pb.h"
#include "ledger/kernel/v1/query.pb.h"
#include "service_context.hpp"

namespace ledger::service {

/*
  Investigation surface over the ledger. Pure reads; errors are thrown as
  util exceptions for the transport adapter to translate.
*/
class QueryService {
public:
  explicit QueryService(ServiceContext ctx);

  ledger::kernel::v1::TraceReconstruction
  QueryTrace(const ledger::kernel::services::v1::QueryTraceRequest& req);

  ledger::kernel::v1::EventList QueryEvents(const ledger::kernel::v1::EventFilter& req);

  ledger::kernel::v1::FailurePath QueryFailurePath(const ledger::kernel::v1::FailureQuery& req);

  ledger::kernel::v1::Journey
  QueryJourney(const ledger::kernel::services::v1::QueryJourneyRequest& req);

  ledger::kernel::services::v1::StoreStatus Status();

private:
  ServiceContext ctx_;
};

}
