#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/contracts/contract.hpp"
#include "internal/kernel/event_sink.hpp"
#include "ledger/kernel/v1/event.pb.h"

namespace ledger::contracts {

struct EngineOptions {
  int64_t defer_ttl_ms = 30000;

  // cascading violations put every worker in safe mode
  std::size_t safe_mode_violations  = 3;
  int64_t     safe_mode_window_ms   = 10000;
  int64_t     safe_mode_duration_ms = 30000;
};

enum class Outcome : std::uint8_t {
  kApplied,
  kDeferred,
  kDropped,
  kCoalesced,
};

std::string_view OutcomeName(Outcome outcome);

struct Decision {
  Outcome                                outcome = Outcome::kApplied;
  std::vector<std::string>               reasons;
  std::vector<ledger::kernel::v1::Event> events;
};

// Lanes left unset are not touched.
struct StatePatch {
  std::optional<model::Activity>        activity;
  std::optional<bool>                   focus_locked;
  std::optional<model::CompactionState> compacting;
  std::optional<model::LinkState>       bridge;
  std::optional<model::LinkState>       terminal;
};

/*
  Per-worker injection gatekeeper.

  Every request is evaluated against all contracts; gates compose, so a
  deferral records every blocking reason in contract order. Deferred
  requests are re-evaluated on each state change, on Release and on
  Tick, and dropped with a reason once their TTL elapses.

  Decision events are returned and also handed to the sink after the
  engine lock is released. Methods take the caller's clock.
*/
class PaneContractEngine {
 public:
  PaneContractEngine(EngineOptions options, std::shared_ptr<kernel::EventSink> sink);

  PaneContractEngine(const PaneContractEngine&)            = delete;
  PaneContractEngine& operator=(const PaneContractEngine&) = delete;

  Decision Submit(const InjectionRequest& request, int64_t now_ms);

  // ends an applied submit/control request and releases its ownership slot;
  // key is the request event id or the request's trace id
  std::vector<ledger::kernel::v1::Event> Complete(const std::string& worker_id, const std::string& key,
                                                  int64_t now_ms);

  std::vector<ledger::kernel::v1::Event> UpdateState(const std::string& worker_id, const StatePatch& patch,
                                                     int64_t now_ms);

  // explicit release: re-evaluate the worker's deferred requests
  std::vector<ledger::kernel::v1::Event> Release(const std::string& worker_id, int64_t now_ms);

  // TTL expiry and safe-mode exit for all workers
  std::vector<ledger::kernel::v1::Event> Tick(int64_t now_ms);

  // worker restarted: pending work is dropped and the vector rebuilt
  std::vector<ledger::kernel::v1::Event> ResetWorker(const std::string& worker_id, int64_t now_ms);

  model::PaneStateVector State(const std::string& worker_id) const;
  std::size_t            DeferredCount(const std::string& worker_id) const;
  bool                   InSafeMode() const;

 private:
  using Events = std::vector<ledger::kernel::v1::Event>;

  struct Verdict {
    std::vector<Violation> blocking;
    std::vector<Violation> bypassed;
  };

  WorkerContext& ContextLocked(const std::string& worker_id);
  Verdict        EvaluateLocked(const InjectionRequest& request, const WorkerContext& context) const;

  Decision SubmitResizeLocked(const InjectionRequest& request, WorkerContext& context, int64_t now_ms);
  void     ApplyLocked(const InjectionRequest& request, WorkerContext& context, const std::string& parent_event_id,
                       int64_t now_ms, Events& out);
  void     ApplyResizeLocked(const InjectionRequest& request, int64_t now_ms, Events& out);
  void     RecheckLocked(WorkerContext& context, int64_t now_ms, Events& out);
  void     DropDeferredLocked(const DeferredRequest& deferred, std::string_view reason, int64_t now_ms, Events& out);

  void RecordViolationLocked(int64_t now_ms, Events& out);
  void EnterSafeModeLocked(int64_t now_ms, Events& out);
  void ExitSafeModeLocked(int64_t now_ms, Events& out);

  void Emit(const Events& events);

  EngineOptions                          options_;
  std::shared_ptr<kernel::EventSink>     sink_;
  std::vector<std::unique_ptr<Contract>> contracts_;

  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, WorkerContext> workers_;
  std::deque<int64_t>                            violation_times_;
  bool                                           safe_mode_       = false;
  int64_t                                        safe_mode_until_ = 0;
};

} // namespace ledger::contracts
