#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/event_query.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/span_record.hpp"

namespace ledger::db {

/*
  Repository abstraction for the event ledger.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction from Begin()
  - Reads inside a transaction see its writes
  - Read transactions from BeginRead() see a consistent committed snapshot
  - event_id is unique; InsertEvent never overwrites
  - row_id grows monotonically in commit order

  The log is append-only apart from Prune(), which removes events and
  cascades to the edges and spans that reference them.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns record.row_id. AlreadyExists on a duplicate event_id.
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, const std::string& event_id) = 0;

  // Arrival order. Returns at most `limit` rows.
  virtual std::vector<model::EventRecord> ListTraceEvents(Transaction&, const std::string& trace_id, uint32_t limit) = 0;

  // Parentless events of a trace, arrival order.
  virtual std::vector<std::string> ListTraceRoots(Transaction&, const std::string& trace_id) = 0;

  virtual std::vector<model::EventRecord> QueryEvents(Transaction&, const model::EventQuery& query) = 0;

  virtual uint64_t CountEvents(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Edges
  // ---------------------------------------------------------------------

  // An identical edge already present is not an error.
  virtual Result InsertEdge(Transaction&, const model::EdgeRecord& record) = 0;

  virtual std::vector<model::EdgeRecord> ListTraceEdges(Transaction&, const std::string& trace_id) = 0;

  // ---------------------------------------------------------------------
  // Spans
  // ---------------------------------------------------------------------

  // span ids are only unique within a trace
  virtual std::optional<model::SpanRecord> GetSpan(Transaction&, const std::string& trace_id,
                                                   const std::string& span_id) = 0;

  virtual Result UpsertSpan(Transaction&, const model::SpanRecord& record) = 0;

  virtual std::vector<model::SpanRecord> ListTraceSpans(Transaction&, const std::string& trace_id) = 0;

  virtual std::vector<model::SpanRecord> ListOpenSpansStartedBefore(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Retention
  // ---------------------------------------------------------------------

  virtual Result Prune(Transaction&, const model::PruneRequest& request, model::PruneCounts* counts) = 0;
};

} // namespace ledger::db
