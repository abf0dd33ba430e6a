#include "internal/store/event_store.hpp"

#include <algorithm>
#include <set>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/ingest/normalizer.hpp"
#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"
#include "internal/model/taxonomy.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::store {

using namespace ledger::kernel::v1;
using ledger::kernel::services::v1::StoreStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kStoreSource = "ledger.store";

db::model::EventRecord ToRecord(const Event& event, std::string envelope, int64_t now_ms) {
  db::model::EventRecord r;
  r.event_id        = event.event_id();
  r.trace_id        = event.trace_id();
  r.span_id         = event.span_id();
  r.parent_event_id = event.parent_event_id();
  r.type            = event.type();
  r.stage           = static_cast<int>(event.stage());
  r.source          = event.source();
  r.worker_id       = event.worker_id();
  r.timestamp_ms    = event.timestamp_ms();
  if (event.has_sequence()) r.sequence = event.sequence();
  r.status         = static_cast<int>(event.status());
  r.envelope       = std::move(envelope);
  r.ingested_at_ms = now_ms;
  return r;
}

std::optional<StoredEvent> FromRecord(const db::model::EventRecord& record) {
  StoredEvent stored;
  stored.row_id = record.row_id;
  if (!stored.event.ParseFromString(record.envelope)) {
    LEDGER_LOG_ERROR("unreadable envelope", {StringField("event_id", record.event_id)});
    return std::nullopt;
  }
  return stored;
}

Edge ToEdge(const db::model::EdgeRecord& record) {
  Edge edge;
  edge.set_trace_id(record.trace_id);
  edge.set_from_event_id(record.from_event_id);
  edge.set_to_event_id(record.to_event_id);
  edge.set_type(static_cast<EdgeType>(record.edge_type));
  edge.set_created_at_ms(record.created_at_ms);
  return edge;
}

Span ToSpan(const db::model::SpanRecord& record, int64_t leak_cutoff_ms) {
  Span span;
  span.set_span_id(record.span_id);
  span.set_trace_id(record.trace_id);
  span.set_stage(static_cast<Stage>(record.stage));
  span.set_worker_id(record.worker_id);
  span.set_source(record.source);
  span.set_started_at_ms(record.started_at_ms);
  if (record.ended_at_ms) span.set_ended_at_ms(*record.ended_at_ms);
  span.set_status(static_cast<EventStatus>(record.status));
  span.set_event_count(record.event_count);
  span.set_leaked(!record.ended_at_ms && record.started_at_ms < leak_cutoff_ms);
  return span;
}

db::Result InsertEdge(db::Repository& repo, db::Transaction& tx, const Event& event, const std::string& from,
                      EdgeType type, int64_t now_ms) {
  db::model::EdgeRecord edge;
  edge.trace_id      = event.trace_id();
  edge.from_event_id = from;
  edge.to_event_id   = event.event_id();
  edge.edge_type     = static_cast<int>(type);
  edge.created_at_ms = now_ms;
  return repo.InsertEdge(tx, edge);
}

constexpr int      kBusyAttempts = 3;
constexpr uint32_t kCopyPage     = 1000;

bool ShouldDegrade(const db::Result& result) {
  return result.code == db::ErrorCode::IOError || result.code == db::ErrorCode::Corruption;
}

bool IsBusyDiagnostic(const Event& event) {
  return event.type() == model::EventTypeName(model::EventKind::kEventDropped) &&
         model::StringField(event.payload(), "reason").value_or("") == "store_busy";
}

// copies events (arrival order), then the edges and spans of their traces
std::size_t CopyHistory(db::Repository& from, db::Repository& to) {
  auto read  = from.BeginRead();
  auto write = to.Begin();

  std::set<std::string> traces;
  std::size_t           copied = 0;

  db::model::EventQuery page;
  page.arrival_order = true;
  page.limit         = kCopyPage;
  for (;;) {
    auto records = from.QueryEvents(*read, page);
    for (auto& record : records) {
      page.after_row_id = record.row_id;
      traces.insert(record.trace_id);
      if (auto r = to.InsertEvent(*write, record); !r) {
        LEDGER_LOG_WARN("history copy skipped event", {StringField("event_id", record.event_id),
                                                       StringField("error", r.message)});
        continue;
      }
      ++copied;
    }
    if (records.size() < kCopyPage) break;
  }

  for (const auto& trace_id : traces) {
    for (const auto& edge : from.ListTraceEdges(*read, trace_id)) {
      if (auto r = to.InsertEdge(*write, edge); !r) {
        LEDGER_LOG_WARN("history copy skipped edge", {StringField("trace_id", trace_id), StringField("error", r.message)});
      }
    }
    for (const auto& span : from.ListTraceSpans(*read, trace_id)) {
      if (auto r = to.UpsertSpan(*write, span); !r) {
        LEDGER_LOG_WARN("history copy skipped span", {StringField("span_id", span.span_id), StringField("error", r.message)});
      }
    }
  }

  write->Commit();
  read->Commit();
  return copied;
}

} // namespace

std::shared_ptr<EventStore> EventStore::Open(const StoreOptions& options, util::MillisClock clock) {
  if (!options.durable) {
    LEDGER_LOG_INFO("event store running in memory", {StringField("reason", "persistence_disabled")});
    return std::make_shared<EventStore>(std::make_shared<db::memory::MemoryRepository>(), false, "persistence_disabled",
                                        options, std::move(clock));
  }

  try {
    auto sqlite = std::make_shared<db::sqlite::SqliteDB>(options.sqlite_path, options.busy_timeout_ms);
    LEDGER_LOG_INFO("event store opened", {StringField("path", options.sqlite_path)});
    return std::make_shared<EventStore>(std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite)), true, "",
                                        options, std::move(clock));
  } catch (const std::exception& e) {
    std::string reason = std::string("sqlite_unavailable: ") + e.what();
    observability::LogOnce(spdlog::level::warn, "store.degraded", "event store degraded to memory",
                           {StringField("path", options.sqlite_path), StringField("reason", reason)});
    return std::make_shared<EventStore>(std::make_shared<db::memory::MemoryRepository>(), false, std::move(reason),
                                        options, std::move(clock));
  }
}

EventStore::EventStore(std::shared_ptr<db::Repository> repository, bool durable, std::string degraded_reason,
                       StoreOptions options, util::MillisClock clock)
    : repository_(std::move(repository)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      durable_(durable),
      degraded_reason_(std::move(degraded_reason)) {
}

// ------------------------------------------------------------------
// Append path
// ------------------------------------------------------------------

AppendResult EventStore::Append(const Event& event) {
  std::unique_lock lock(mutex_);
  return AppendWithDiagnosticsLocked(event);
}

std::vector<AppendResult> EventStore::AppendBatch(const std::vector<Event>& events) {
  std::vector<AppendResult> results;
  results.reserve(events.size());

  std::unique_lock lock(mutex_);
  for (const auto& event : events) {
    results.push_back(AppendWithDiagnosticsLocked(event));
  }
  return results;
}

AppendResult EventStore::AppendWithDiagnosticsLocked(const Event& event) {
  std::vector<Event> diagnostics;
  auto               result = AppendLocked(event, &diagnostics);

  // diagnostics never produce further diagnostics of their own kind, so this ends
  while (!diagnostics.empty()) {
    Event diagnostic = std::move(diagnostics.front());
    diagnostics.erase(diagnostics.begin());
    auto diag_result = AppendLocked(diagnostic, &diagnostics);
    if (!diag_result.ok) {
      LEDGER_LOG_WARN("diagnostic append failed",
                      {StringField("type", diagnostic.type()), StringField("reason", diag_result.reason)});
    }
  }
  return result;
}

AppendResult EventStore::AppendLocked(const Event& event, std::vector<Event>* diagnostics) {
  AppendResult result;
  result.event_id = event.event_id();

  auto normalized = ingest::Normalize(event);
  if (!normalized.ok) {
    invalid_.fetch_add(1);
    result.reason = "invalid";
    result.errors = normalized.errors;
    diagnostics->push_back(ingest::BuildInvalidDiagnostic(normalized.errors, event.event_id(), event.type(), clock_()));
    return result;
  }

  auto write = WriteLocked(normalized.event, diagnostics);
  for (int attempt = 1; write.code == db::ErrorCode::Busy && attempt < kBusyAttempts; ++attempt) {
    LEDGER_LOG_WARN("store busy, retrying", {StringField("event_id", event.event_id()), IntField("attempt", attempt)});
    write = WriteLocked(normalized.event, diagnostics);
  }
  if (write.code == db::ErrorCode::AlreadyExists) {
    duplicates_.fetch_add(1);
    result.reason = "duplicate";
    return result;
  }
  if (write.code == db::ErrorCode::Busy) {
    RecordBusyLocked(normalized.event, write.message, diagnostics);
    result.reason = "busy";
    result.errors.push_back(write.message);
    return result;
  }
  if (ShouldDegrade(write)) {
    DegradeLocked(write.message);
    write = WriteLocked(normalized.event, diagnostics);
  }
  if (!write) {
    LEDGER_LOG_ERROR("append failed", {StringField("event_id", event.event_id()), StringField("error", write.message)});
    result.reason = "storage_error";
    result.errors.push_back(write.message);
    return result;
  }

  appended_.fetch_add(1);
  result.ok = true;
  return result;
}

db::Result EventStore::WriteLocked(const Event& event, std::vector<Event>* diagnostics) {
  const int64_t now_ms = clock_();

  std::string envelope;
  if (!event.SerializeToString(&envelope)) {
    return db::Result::Err(db::ErrorCode::InternalError, "envelope serialization failed");
  }

  try {
    auto tx = repository_->Begin();

    std::vector<std::string> existing_roots;
    if (event.parent_event_id().empty()) {
      existing_roots = repository_->ListTraceRoots(*tx, event.trace_id());
    }

    auto record = ToRecord(event, std::move(envelope), now_ms);
    if (auto r = repository_->InsertEvent(*tx, record); !r) return r;

    // edges
    if (!event.parent_event_id().empty()) {
      if (auto r = InsertEdge(*repository_, *tx, event, event.parent_event_id(), EDGE_TYPE_PARENT, now_ms); !r) return r;
    }
    std::string ack_of = event.ack_of_event_id();
    if (ack_of.empty() && event.stage() == STAGE_ACK) ack_of = event.parent_event_id();
    if (!ack_of.empty()) {
      if (auto r = InsertEdge(*repository_, *tx, event, ack_of, EDGE_TYPE_ACK_OF, now_ms); !r) return r;
    }
    if (!event.retry_of_event_id().empty()) {
      if (auto r = InsertEdge(*repository_, *tx, event, event.retry_of_event_id(), EDGE_TYPE_RETRY_OF, now_ms); !r) {
        return r;
      }
    }

    // span
    auto span = repository_->GetSpan(*tx, event.trace_id(), event.span_id());
    if (!span) {
      span                = db::model::SpanRecord{};
      span->span_id       = event.span_id();
      span->trace_id      = event.trace_id();
      span->stage         = static_cast<int>(event.stage());
      span->worker_id     = event.worker_id();
      span->source        = event.source();
      span->started_at_ms = event.timestamp_ms();
      span->status        = static_cast<int>(EVENT_STATUS_UNKNOWN);
    }
    span->event_count += 1;
    if (!span->ended_at_ms && model::IsTerminalStatus(event.status())) {
      span->ended_at_ms = std::max(event.timestamp_ms(), span->started_at_ms);
      span->status      = static_cast<int>(event.status());
    }
    if (auto r = repository_->UpsertSpan(*tx, *span); !r) return r;

    tx->Commit();

    if (!existing_roots.empty()) {
      LEDGER_LOG_WARN("duplicate trace root", {StringField("trace_id", event.trace_id()),
                                               StringField("event_id", event.event_id())});
      diagnostics->push_back(
          model::EventBuilder(model::EventTypeName(model::EventKind::kTraceRootDuplicate), STAGE_SYSTEM, kStoreSource,
                              now_ms)
              .Parent(event)
              .Worker(event.worker_id())
              .Status(EVENT_STATUS_FAILED)
              .Field("duplicateEventId", event.event_id())
              .Field("existingRoots", existing_roots)
              .Build());
    }
    return db::Result::Ok();
  } catch (const db::Error& e) {
    return db::Result::Err(e.code(), e.what());
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  }
}

void EventStore::RecordBusyLocked(const Event& event, const std::string& message, std::vector<Event>* diagnostics) {
  busy_.fetch_add(1);
  LEDGER_LOG_ERROR("store busy, event rejected", {StringField("event_id", event.event_id()), StringField("error", message)});
  if (IsBusyDiagnostic(event)) return;

  model::EventBuilder dropped(model::EventTypeName(model::EventKind::kEventDropped), STAGE_SYSTEM, kStoreSource,
                              clock_());
  // parented like the lost event; never a second root of its trace
  if (!event.parent_event_id().empty()) {
    dropped.ParentId(event.trace_id(), event.parent_event_id());
  } else {
    dropped.Trace(event.trace_id());
  }
  diagnostics->push_back(dropped.Worker(event.worker_id())
                             .Status(EVENT_STATUS_DROPPED)
                             .Field("reason", "store_busy")
                             .Field("droppedCount", static_cast<uint64_t>(1))
                             .Field("droppedEventId", event.event_id())
                             .Field("droppedType", event.type())
                             .Build());
}

void EventStore::DegradeLocked(const std::string& reason) {
  auto        memory  = std::make_shared<db::memory::MemoryRepository>();
  std::size_t carried = 0;
  try {
    carried = CopyHistory(*repository_, *memory);
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("history unreadable while degrading", {StringField("error", e.what())});
  }

  repository_      = std::move(memory);
  durable_         = false;
  degraded_reason_ = "storage_failure: " + reason;
  observability::LogOnce(spdlog::level::warn, "store.degraded", "event store degraded to memory",
                         {StringField("reason", degraded_reason_), IntField("carried_events", static_cast<int64_t>(carried))});
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<Event> EventStore::GetEvent(const std::string& event_id) {
  auto envelope = GetEnvelope(event_id);
  if (!envelope) return std::nullopt;

  Event event;
  if (!event.ParseFromString(*envelope)) return std::nullopt;
  return event;
}

std::optional<std::string> EventStore::GetEnvelope(const std::string& event_id) {
  std::shared_lock lock(mutex_);
  auto             tx     = repository_->BeginRead();
  auto             record = repository_->GetEvent(*tx, event_id);
  tx->Commit();
  if (!record) return std::nullopt;
  return record->envelope;
}

TraceSlice EventStore::QueryByTrace(const std::string& trace_id, uint32_t limit) {
  if (limit == 0) limit = kDefaultTraceLimit;
  limit = std::min(limit, kMaxTraceLimit);

  TraceSlice slice;

  std::shared_lock lock(mutex_);
  auto             tx = repository_->BeginRead();

  auto records = repository_->ListTraceEvents(*tx, trace_id, limit + 1);
  if (records.size() > limit) {
    records.resize(limit);
    slice.truncated = true;
  }
  for (const auto& record : records) {
    if (auto stored = FromRecord(record)) slice.events.push_back(std::move(*stored));
  }

  for (const auto& edge : repository_->ListTraceEdges(*tx, trace_id)) {
    slice.edges.push_back(ToEdge(edge));
  }

  const int64_t leak_cutoff = clock_() - options_.span_timeout_ms;
  for (const auto& span : repository_->ListTraceSpans(*tx, trace_id)) {
    slice.spans.push_back(ToSpan(span, leak_cutoff));
  }

  slice.roots = repository_->ListTraceRoots(*tx, trace_id);
  tx->Commit();
  return slice;
}

FilterResult EventStore::QueryByFilter(const EventFilter& filter) {
  uint32_t limit = filter.limit() == 0 ? kDefaultFilterLimit : std::min(filter.limit(), kMaxFilterLimit);

  db::model::EventQuery query;
  if (filter.stage() != STAGE_UNSPECIFIED) query.stage = static_cast<int>(filter.stage());
  if (!filter.type().empty()) query.type = filter.type();
  if (!filter.worker_id().empty()) query.worker_id = filter.worker_id();
  if (!filter.trace_id().empty()) query.trace_id = filter.trace_id();
  if (filter.has_since_ms()) query.since_ms = filter.since_ms();
  if (filter.has_until_ms()) query.until_ms = filter.until_ms();
  query.limit      = limit + 1;
  query.descending = filter.descending();

  FilterResult result;

  std::shared_lock lock(mutex_);
  auto             tx      = repository_->BeginRead();
  auto             records = repository_->QueryEvents(*tx, query);
  tx->Commit();

  if (records.size() > limit) {
    records.resize(limit);
    result.truncated = true;
  }
  for (const auto& record : records) {
    if (auto stored = FromRecord(record)) result.events.push_back(std::move(*stored));
  }
  return result;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

db::model::PruneCounts EventStore::Prune(int64_t now_ms) {
  db::model::PruneRequest request;
  request.older_than_ms = now_ms - options_.retention_ms;
  if (options_.max_rows > 0) request.max_rows = options_.max_rows;

  db::model::PruneCounts counts;

  std::unique_lock lock(mutex_);
  try {
    auto tx = repository_->Begin();
    if (auto r = repository_->Prune(*tx, request, &counts); !r) {
      LEDGER_LOG_ERROR("prune failed", {StringField("error", r.message)});
      return {};
    }
    tx->Commit();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("prune failed", {StringField("error", e.what())});
    return {};
  }

  pruned_.fetch_add(counts.events);
  if (counts.events > 0) {
    LEDGER_LOG_INFO("pruned events", {IntField("events", static_cast<int64_t>(counts.events)),
                                      IntField("edges", static_cast<int64_t>(counts.edges)),
                                      IntField("spans", static_cast<int64_t>(counts.spans))});
  }
  return counts;
}

std::size_t EventStore::SweepSpans(int64_t now_ms) {
  std::unique_lock   lock(mutex_);
  std::vector<Event> timeouts;

  try {
    auto tx    = repository_->Begin();
    auto stale = repository_->ListOpenSpansStartedBefore(*tx, now_ms - options_.span_timeout_ms);

    for (auto& span : stale) {
      span.ended_at_ms = now_ms;
      span.status      = static_cast<int>(EVENT_STATUS_TIMEOUT);
      if (auto r = repository_->UpsertSpan(*tx, span); !r) {
        LEDGER_LOG_ERROR("span sweep failed", {StringField("span_id", span.span_id), StringField("error", r.message)});
        return 0;
      }

      // hang the timeout off the span's newest event
      std::string last_event_id;
      for (const auto& record : repository_->ListTraceEvents(*tx, span.trace_id, kMaxTraceLimit)) {
        if (record.span_id == span.span_id) last_event_id = record.event_id;
      }

      model::EventBuilder builder(model::EventTypeName(model::EventKind::kSpanTimeout), STAGE_SYSTEM, kStoreSource,
                                  now_ms);
      if (last_event_id.empty()) {
        builder.Trace(span.trace_id);
      } else {
        builder.ParentId(span.trace_id, last_event_id);
      }
      timeouts.push_back(builder.Worker(span.worker_id)
                             .Status(EVENT_STATUS_TIMEOUT)
                             .Field("spanId", span.span_id)
                             .Field("stage", model::StageName(static_cast<Stage>(span.stage)))
                             .Field("startedAtMs", span.started_at_ms)
                             .Field("timeoutMs", options_.span_timeout_ms)
                             .Build());
    }
    tx->Commit();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("span sweep failed", {StringField("error", e.what())});
    return 0;
  }

  for (const auto& event : timeouts) {
    AppendWithDiagnosticsLocked(event);
  }
  return timeouts.size();
}

StoreStatus EventStore::Status() {
  StoreStatus status;

  std::shared_lock lock(mutex_);
  auto             tx = repository_->BeginRead();
  status.set_row_count(repository_->CountEvents(*tx));
  tx->Commit();

  status.set_durable(durable_);
  status.set_degraded_reason(degraded_reason_);
  status.set_appended_count(appended_.load());
  status.set_duplicate_count(duplicates_.load());
  status.set_invalid_count(invalid_.load());
  status.set_pruned_count(pruned_.load());
  status.set_busy_count(busy_.load());
  status.set_db_path(durable_ ? options_.sqlite_path : "");
  return status;
}

} // namespace ledger::store
