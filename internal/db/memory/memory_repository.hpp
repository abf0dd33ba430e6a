#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <utility>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ledger::db::memory {

class MemoryTransaction;

/*
  In-memory backend. Used when durable persistence is disabled or the
  sqlite file cannot be opened, and as the reference in parity tests.

  A write transaction holds state_mutex_ exclusively and mutates the
  state in place, recording an undo step per change; readers hold it
  shared, so they only ever observe committed state.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, const std::string&) override;
  std::vector<model::EventRecord> ListTraceEvents(Transaction&, const std::string&, uint32_t limit) override;
  std::vector<std::string> ListTraceRoots(Transaction&, const std::string&) override;
  std::vector<model::EventRecord> QueryEvents(Transaction&, const model::EventQuery&) override;
  uint64_t CountEvents(Transaction&) override;

  Result InsertEdge(Transaction&, const model::EdgeRecord&) override;
  std::vector<model::EdgeRecord> ListTraceEdges(Transaction&, const std::string&) override;

  std::optional<model::SpanRecord> GetSpan(Transaction&, const std::string&, const std::string&) override;
  Result UpsertSpan(Transaction&, const model::SpanRecord&) override;
  std::vector<model::SpanRecord> ListTraceSpans(Transaction&, const std::string&) override;
  std::vector<model::SpanRecord> ListOpenSpansStartedBefore(Transaction&, int64_t cutoff_ms) override;

  Result Prune(Transaction&, const model::PruneRequest&, model::PruneCounts*) override;

private:
  friend class MemoryTransaction;

  using EdgeKey = std::tuple<std::string, std::string, std::string, int>;
  using SpanKey = std::pair<std::string, std::string>; // trace_id, span_id

  struct State {
    std::map<int64_t, model::EventRecord>    events; // by row_id
    std::unordered_map<std::string, int64_t> row_by_event_id;
    std::map<EdgeKey, model::EdgeRecord>     edges;
    std::vector<EdgeKey>                     edge_order;
    std::map<SpanKey, model::SpanRecord>     spans;
    int64_t                                  next_row_id = 1;
  };

  std::shared_mutex state_mutex_;
  State             committed_;
};

}
