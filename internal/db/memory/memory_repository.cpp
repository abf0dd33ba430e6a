#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto& s = tx.Mutable();
  if (s.row_by_event_id.contains(r.event_id)) return Result::Err(ErrorCode::AlreadyExists, "duplicate event_id");

  r.row_id = s.next_row_id++;
  s.events.emplace(r.row_id, r);
  s.row_by_event_id.emplace(r.event_id, r.row_id);

  tx.RecordUndo([row_id = r.row_id, event_id = r.event_id](State& st) {
    st.events.erase(row_id);
    st.row_by_event_id.erase(event_id);
    st.next_row_id = row_id;
  });
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.row_by_event_id.find(event_id);
  if (it == s.row_by_event_id.end()) return std::nullopt;
  return s.events.at(it->second);
}

std::vector<model::EventRecord> MemoryRepository::ListTraceEvents(Transaction& t, const std::string& trace_id,
                                                                  uint32_t limit) {
  std::vector<model::EventRecord> out;
  for (const auto& [_, e] : TX(t).View().events) {
    if (out.size() >= limit) break;
    if (e.trace_id == trace_id) out.push_back(e);
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListTraceRoots(Transaction& t, const std::string& trace_id) {
  std::vector<std::string> out;
  for (const auto& [_, e] : TX(t).View().events) {
    if (e.trace_id == trace_id && e.parent_event_id.empty()) out.push_back(e.event_id);
  }
  return out;
}

std::vector<model::EventRecord> MemoryRepository::QueryEvents(Transaction& t, const model::EventQuery& q) {
  std::vector<const model::EventRecord*> matched;
  for (const auto& [_, e] : TX(t).View().events) {
    if (q.stage && e.stage != *q.stage) continue;
    if (q.type && e.type != *q.type) continue;
    if (q.worker_id && e.worker_id != *q.worker_id) continue;
    if (q.trace_id && e.trace_id != *q.trace_id) continue;
    if (q.since_ms && e.timestamp_ms < *q.since_ms) continue;
    if (q.until_ms && e.timestamp_ms >= *q.until_ms) continue;
    if (q.after_row_id && e.row_id <= *q.after_row_id) continue;
    matched.push_back(&e);
  }

  std::sort(matched.begin(), matched.end(), [&](const model::EventRecord* a, const model::EventRecord* b) {
    if (!q.arrival_order && a->timestamp_ms != b->timestamp_ms) {
      return q.descending ? a->timestamp_ms > b->timestamp_ms : a->timestamp_ms < b->timestamp_ms;
    }
    return q.descending ? a->row_id > b->row_id : a->row_id < b->row_id;
  });

  std::vector<model::EventRecord> out;
  for (const auto* e : matched) {
    if (out.size() >= q.limit) break;
    out.push_back(*e);
  }
  return out;
}

uint64_t MemoryRepository::CountEvents(Transaction& t) {
  return TX(t).View().events.size();
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result MemoryRepository::InsertEdge(Transaction& t, const model::EdgeRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto&   s = tx.Mutable();
  EdgeKey key{r.trace_id, r.from_event_id, r.to_event_id, r.edge_type};
  if (s.edges.contains(key)) return Result::Ok();

  s.edges.emplace(key, r);
  s.edge_order.push_back(key);
  tx.RecordUndo([key](State& st) {
    st.edges.erase(key);
    st.edge_order.pop_back();
  });
  return Result::Ok();
}

std::vector<model::EdgeRecord> MemoryRepository::ListTraceEdges(Transaction& t, const std::string& trace_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::EdgeRecord> out;
  for (const auto& key : s.edge_order) {
    if (std::get<0>(key) != trace_id) continue;
    out.push_back(s.edges.at(key));
  }
  return out;
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

std::optional<model::SpanRecord> MemoryRepository::GetSpan(Transaction& t, const std::string& trace_id,
                                                          const std::string& span_id) {
  const auto& s  = TX(t).View();
  auto        it = s.spans.find(SpanKey{trace_id, span_id});
  if (it == s.spans.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertSpan(Transaction& t, const model::SpanRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto&   s = tx.Mutable();
  SpanKey key{r.trace_id, r.span_id};
  auto    it = s.spans.find(key);
  if (it == s.spans.end()) {
    s.spans.emplace(key, r);
    tx.RecordUndo([key](State& st) { st.spans.erase(key); });
    return Result::Ok();
  }

  // identity columns are fixed at creation, like the sqlite upsert
  model::SpanRecord previous = it->second;
  it->second.ended_at_ms     = r.ended_at_ms;
  it->second.status          = r.status;
  it->second.event_count     = r.event_count;
  tx.RecordUndo([key, previous](State& st) { st.spans[key] = previous; });
  return Result::Ok();
}

std::vector<model::SpanRecord> MemoryRepository::ListTraceSpans(Transaction& t, const std::string& trace_id) {
  std::vector<model::SpanRecord> out;
  for (const auto& [_, span] : TX(t).View().spans) {
    if (span.trace_id == trace_id) out.push_back(span);
  }
  std::sort(out.begin(), out.end(), [](const model::SpanRecord& a, const model::SpanRecord& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms < b.started_at_ms;
    return a.span_id < b.span_id;
  });
  return out;
}

std::vector<model::SpanRecord> MemoryRepository::ListOpenSpansStartedBefore(Transaction& t, int64_t cutoff_ms) {
  std::vector<model::SpanRecord> out;
  for (const auto& [_, span] : TX(t).View().spans) {
    if (!span.ended_at_ms && span.started_at_ms < cutoff_ms) out.push_back(span);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::SpanRecord& a, const model::SpanRecord& b) {
    return a.started_at_ms < b.started_at_ms;
  });
  return out;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result MemoryRepository::Prune(Transaction& t, const model::PruneRequest& request, model::PruneCounts* counts) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto&              s = tx.Mutable();
  model::PruneCounts local;

  std::set<std::string> doomed;
  std::size_t           survivors = s.events.size();
  for (const auto& [row_id, e] : s.events) {
    if (request.older_than_ms && e.ingested_at_ms < *request.older_than_ms) {
      doomed.insert(e.event_id);
      --survivors;
    }
  }
  if (request.max_rows && survivors > *request.max_rows) {
    std::size_t excess = survivors - *request.max_rows;
    for (const auto& [row_id, e] : s.events) {
      if (excess == 0) break;
      if (doomed.insert(e.event_id).second) --excess;
    }
  }
  if (doomed.empty()) {
    if (counts) *counts = local;
    return Result::Ok();
  }

  // snapshot for rollback; pruning is rare and already O(n)
  tx.RecordUndo([saved = s](State& st) { st = saved; });

  std::vector<EdgeKey> kept_order;
  for (const auto& key : s.edge_order) {
    if (doomed.contains(std::get<1>(key)) || doomed.contains(std::get<2>(key))) {
      s.edges.erase(key);
      ++local.edges;
    } else {
      kept_order.push_back(key);
    }
  }
  s.edge_order = std::move(kept_order);

  std::set<SpanKey> live_spans;
  for (auto it = s.events.begin(); it != s.events.end();) {
    if (doomed.contains(it->second.event_id)) {
      s.row_by_event_id.erase(it->second.event_id);
      it = s.events.erase(it);
      ++local.events;
    } else {
      live_spans.insert(SpanKey{it->second.trace_id, it->second.span_id});
      ++it;
    }
  }

  for (auto it = s.spans.begin(); it != s.spans.end();) {
    if (!live_spans.contains(it->first)) {
      it = s.spans.erase(it);
      ++local.spans;
    } else {
      ++it;
    }
  }

  if (counts) *counts = local;
  return Result::Ok();
}

} // namespace ledger::db::memory
