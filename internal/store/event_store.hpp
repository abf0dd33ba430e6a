#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "ledger/kernel/services/v1/ledger_query_service.pb.h"
#include "ledger/kernel/v1/event.pb.h"
#include "ledger/kernel/v1/query.pb.h"

namespace ledger::store {

struct StoreOptions {
  bool        durable = true;
  std::string sqlite_path = "ledger.db";
  int         busy_timeout_ms = 5000;
  int64_t     retention_ms    = 7ll * 24 * 60 * 60 * 1000;
  uint64_t    max_rows        = 2'000'000;
  int64_t     span_timeout_ms = 60'000;
};

struct AppendResult {
  bool                     ok = false;
  std::string              reason; // duplicate | invalid | busy | storage_error
  std::string              event_id;
  std::vector<std::string> errors;
};

struct StoredEvent {
  int64_t                   row_id = 0;
  ledger::kernel::v1::Event event;
};

struct TraceSlice {
  std::vector<StoredEvent>             events; // arrival order
  std::vector<ledger::kernel::v1::Edge> edges;
  std::vector<ledger::kernel::v1::Span> spans;
  std::vector<std::string>             roots;
  bool                                 truncated = false;
};

struct FilterResult {
  std::vector<StoredEvent> events;
  bool                     truncated = false;
};

inline constexpr uint32_t kDefaultTraceLimit  = 1000;
inline constexpr uint32_t kMaxTraceLimit      = 5000;
inline constexpr uint32_t kDefaultFilterLimit = 500;
inline constexpr uint32_t kMaxFilterLimit     = 10000;

/*
  EventStore

  The single append path of the ledger. Appends serialize on an exclusive
  lock; reads share it and always see a prefix of the committed log.

  Append never throws into the producer. Rejections (duplicate id, failed
  validation, storage error) come back in AppendResult and are counted;
  validation failures and duplicate trace roots also leave a diagnostic
  event in the log.

  A write that stays busy after the lock wait is retried a few times and
  then rejected with reason "busy" and an event.dropped{reason=store_busy}
  diagnostic; the store stays durable.

  If the sqlite file cannot be opened, or a write later fails with an I/O
  or corruption error, the store continues on the in-memory backend and
  reports the degraded reason in Status(). A runtime degradation first
  copies the readable history into memory so earlier traces stay queryable.
*/
class EventStore {
 public:
  static std::shared_ptr<EventStore> Open(const StoreOptions& options, util::MillisClock clock);

  EventStore(std::shared_ptr<db::Repository> repository, bool durable, std::string degraded_reason,
             StoreOptions options, util::MillisClock clock);

  AppendResult              Append(const ledger::kernel::v1::Event& event);
  std::vector<AppendResult> AppendBatch(const std::vector<ledger::kernel::v1::Event>& events);

  std::optional<ledger::kernel::v1::Event> GetEvent(const std::string& event_id);
  // the envelope bytes exactly as stored
  std::optional<std::string> GetEnvelope(const std::string& event_id);

  // limit 0 means the default; capped at kMaxTraceLimit
  TraceSlice   QueryByTrace(const std::string& trace_id, uint32_t limit = 0);
  FilterResult QueryByFilter(const ledger::kernel::v1::EventFilter& filter);

  // retention TTL then row cap; returns what was removed
  db::model::PruneCounts Prune(int64_t now_ms);

  // closes spans open longer than the span timeout; returns how many
  std::size_t SweepSpans(int64_t now_ms);

  ledger::kernel::services::v1::StoreStatus Status();

  int64_t SpanTimeoutMs() const {
    return options_.span_timeout_ms;
  }

  int64_t NowMs() const {
    return clock_();
  }

 private:
  AppendResult AppendLocked(const ledger::kernel::v1::Event& event, std::vector<ledger::kernel::v1::Event>* diagnostics);
  AppendResult AppendWithDiagnosticsLocked(const ledger::kernel::v1::Event& event);
  db::Result   WriteLocked(const ledger::kernel::v1::Event& event, std::vector<ledger::kernel::v1::Event>* diagnostics);
  void         DegradeLocked(const std::string& reason);
  void         RecordBusyLocked(const ledger::kernel::v1::Event& event, const std::string& message,
                                std::vector<ledger::kernel::v1::Event>* diagnostics);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;
  util::MillisClock               clock_;

  mutable std::shared_mutex mutex_;
  bool                      durable_;
  std::string               degraded_reason_;

  std::atomic<uint64_t> appended_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> invalid_{0};
  std::atomic<uint64_t> pruned_{0};
  std::atomic<uint64_t> busy_{0};
};

} // namespace ledger::store
