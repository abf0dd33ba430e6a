#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/store/event_store.hpp"
#include "ledger/kernel/v1/query.pb.h"

namespace ledger::query {

struct CausalOrder {
  std::vector<ledger::kernel::v1::Event> ordered; // every event, parents before children
  std::vector<ledger::kernel::v1::Event> orphans; // parent set but not in the trace
};

/*
  Orders one trace causally.

  Rank is depth in the parent graph; orphans and events caught in a
  parent cycle rank as roots. Within a rank, timestamp then arrival order,
  except that events of one source keep their sequence order.
*/
CausalOrder OrderCausally(const std::vector<store::StoredEvent>& events);

// Best-effort reason for a failure, from the failing event and its trace.
ledger::kernel::v1::FailureClassification ClassifyFailure(const ledger::kernel::v1::Event& failure,
                                                          const std::vector<ledger::kernel::v1::Event>& trace);

/*
  Read-only queries over the ledger. Nothing here writes to the store.
*/
class TraceQueryEngine {
 public:
  explicit TraceQueryEngine(std::shared_ptr<store::EventStore> store);

  ledger::kernel::v1::TraceReconstruction QueryTrace(const std::string& trace_id, uint32_t limit = 0);

  ledger::kernel::v1::EventList QueryEvents(const ledger::kernel::v1::EventFilter& filter);

  ledger::kernel::v1::FailurePath QueryFailurePath(const ledger::kernel::v1::FailureQuery& query);

  ledger::kernel::v1::Journey QueryJourney(const std::string& trace_id);

 private:
  std::shared_ptr<store::EventStore> store_;
};

} // namespace ledger::query
