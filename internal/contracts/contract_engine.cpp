#include "internal/contracts/contract_engine.hpp"

#include <algorithm>
#include <utility>

#include "internal/model/event_builder.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::contracts {

namespace v1 = ledger::kernel::v1;

namespace {

constexpr const char* kSource = "ledger.contracts";

std::vector<std::string> Reasons(const std::vector<Violation>& violations) {
  std::vector<std::string> reasons;
  reasons.reserve(violations.size());
  for (const auto& v : violations) reasons.push_back(v.reason);
  return reasons;
}

std::vector<std::string> ContractIds(const std::vector<Violation>& violations) {
  std::vector<std::string> ids;
  ids.reserve(violations.size());
  for (const auto& v : violations) ids.push_back(v.contract_id);
  return ids;
}

model::EventBuilder Chain(std::string_view type, const InjectionRequest& request, std::string_view parent_event_id,
                          int64_t now_ms) {
  model::EventBuilder builder(type, v1::STAGE_INJECT, kSource, now_ms);
  builder.ParentId(request.trace_id, parent_event_id)
      .Worker(request.worker_id)
      .Field("requestId", request.request_id)
      .Field("operation", OperationClassName(request.op));
  return builder;
}

void ApplyPatch(model::PaneStateVector& state, const StatePatch& patch) {
  if (patch.activity) state.activity = *patch.activity;
  if (patch.focus_locked) state.gates.focus_locked = *patch.focus_locked;
  if (patch.compacting) state.gates.compacting = *patch.compacting;
  if (patch.bridge) state.connectivity.bridge = *patch.bridge;
  if (patch.terminal) state.connectivity.terminal = *patch.terminal;
}

bool SameState(const model::PaneStateVector& a, const model::PaneStateVector& b) {
  return a.activity == b.activity && a.gates.focus_locked == b.gates.focus_locked &&
         a.gates.compacting == b.gates.compacting && a.gates.safe_mode == b.gates.safe_mode &&
         a.connectivity.bridge == b.connectivity.bridge && a.connectivity.terminal == b.connectivity.terminal;
}

v1::Event StateChangedEvent(const std::string& worker_id, const model::PaneStateVector& state, std::string_view reason,
                            int64_t now_ms) {
  return model::EventBuilder("pane.state.changed", v1::STAGE_SYSTEM, kSource, now_ms)
      .Worker(worker_id)
      .Field("reason", reason)
      .Field("activity", model::ActivityName(state.activity))
      .Field("focusLocked", state.gates.focus_locked)
      .Field("compacting", model::CompactionStateName(state.gates.compacting))
      .Field("safeMode", state.gates.safe_mode)
      .Field("bridge", model::LinkStateName(state.connectivity.bridge))
      .Field("terminal", model::LinkStateName(state.connectivity.terminal))
      .Build();
}

} // namespace

std::string_view OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kDeferred:
      return "deferred";
    case Outcome::kDropped:
      return "dropped";
    case Outcome::kCoalesced:
      return "coalesced";
  }
  return "applied";
}

PaneContractEngine::PaneContractEngine(EngineOptions options, std::shared_ptr<kernel::EventSink> sink)
    : options_(options), sink_(std::move(sink)), contracts_(BuiltinContracts()) {
}

Decision PaneContractEngine::Submit(const InjectionRequest& request, int64_t now_ms) {
  Decision decision;
  {
    std::lock_guard lock(mutex_);
    WorkerContext& context = ContextLocked(request.worker_id);

    if (request.op == OperationClass::kResize) {
      decision = SubmitResizeLocked(request, context, now_ms);
    } else {
      Verdict verdict = EvaluateLocked(request, context);

      auto block = std::find_if(verdict.blocking.begin(), verdict.blocking.end(),
                                [](const Violation& v) { return v.action == ContractAction::kBlock; });

      if (block != verdict.blocking.end()) {
        const InFlight& owner = context.in_flight.at(request.op);

        auto violation = Chain("contract.violation", request, request.request_id, now_ms)
                             .Status(v1::EVENT_STATUS_FAILED)
                             .Field("kind", block->reason)
                             .Field("contractId", block->contract_id)
                             .Field("action", "block")
                             .Field("severity", "error")
                             .Field("actor", request.actor)
                             .Field("ownerActor", owner.actor)
                             .Field("ownerRequestId", owner.request_id)
                             .Build();

        auto dropped = model::EventBuilder("inject.dropped", v1::STAGE_INJECT, kSource, now_ms)
                           .Parent(violation)
                           .Worker(request.worker_id)
                           .Status(v1::EVENT_STATUS_DROPPED)
                           .Field("reason", block->reason)
                           .Field("contractId", block->contract_id)
                           .Field("originalEventId", request.request_id)
                           .Field("operation", OperationClassName(request.op))
                           .Build();

        decision.outcome = Outcome::kDropped;
        decision.reasons = {block->reason};
        decision.events.push_back(std::move(violation));
        decision.events.push_back(std::move(dropped));
        RecordViolationLocked(now_ms, decision.events);
      } else if (!verdict.blocking.empty()) {
        DeferredRequest deferred;
        deferred.request        = request;
        deferred.deferred_at_ms = now_ms;
        deferred.expires_at_ms  = now_ms + options_.defer_ttl_ms;
        deferred.reasons        = Reasons(verdict.blocking);

        auto event = Chain("inject.deferred", request, request.request_id, now_ms)
                         .Status(v1::EVENT_STATUS_DEFERRED)
                         .Field("reasons", deferred.reasons)
                         .Field("contracts", ContractIds(verdict.blocking))
                         .Field("ttlMs", options_.defer_ttl_ms)
                         .Field("expiresAtMs", deferred.expires_at_ms)
                         .Field("recheck", false)
                         .Build();
        deferred.last_event_id = event.event_id();

        decision.outcome = Outcome::kDeferred;
        decision.reasons = deferred.reasons;
        decision.events.push_back(std::move(event));
        context.deferred.push_back(std::move(deferred));
        RecordViolationLocked(now_ms, decision.events);
      } else {
        std::string parent = request.request_id;
        if (!verdict.bypassed.empty()) {
          auto override_event = Chain("inject.override", request, parent, now_ms)
                                    .Field("bypassedGates", Reasons(verdict.bypassed))
                                    .Field("contracts", ContractIds(verdict.bypassed))
                                    .Field("intent", request.intent)
                                    .Field("actor", request.actor)
                                    .Build();
          parent = override_event.event_id();
          decision.reasons = Reasons(verdict.bypassed);
          decision.events.push_back(std::move(override_event));
        }
        decision.outcome = Outcome::kApplied;
        ApplyLocked(request, context, parent, now_ms, decision.events);
      }
    }
  }
  Emit(decision.events);
  return decision;
}

std::vector<v1::Event> PaneContractEngine::Complete(const std::string& worker_id, const std::string& key,
                                                    int64_t now_ms) {
  Events out;
  {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return out;
    WorkerContext& context = it->second;

    bool released = false;
    for (auto slot = context.in_flight.begin(); slot != context.in_flight.end();) {
      if (slot->second.request_id == key || slot->second.trace_id == key) {
        slot     = context.in_flight.erase(slot);
        released = true;
      } else {
        ++slot;
      }
    }
    if (!released) {
      LEDGER_LOG_DEBUG("completion for request not in flight", {observability::StringField("worker_id", worker_id),
                                                                observability::StringField("key", key)});
      return out;
    }

    if (context.in_flight.count(OperationClass::kSubmit)) {
      context.state.activity = model::Activity::kInjecting;
    } else if (context.in_flight.count(OperationClass::kControl)) {
      context.state.activity = model::Activity::kRecovering;
    } else {
      context.state.activity = model::Activity::kIdle;
    }

    if (context.state.activity != model::Activity::kInjecting && context.pending_resize) {
      InjectionRequest resize = std::move(*context.pending_resize);
      context.pending_resize.reset();
      ApplyResizeLocked(resize, now_ms, out);
    }
    RecheckLocked(context, now_ms, out);
  }
  Emit(out);
  return out;
}

std::vector<v1::Event> PaneContractEngine::UpdateState(const std::string& worker_id, const StatePatch& patch,
                                                       int64_t now_ms) {
  Events out;
  {
    std::lock_guard lock(mutex_);
    WorkerContext& context = ContextLocked(worker_id);

    model::PaneStateVector before = context.state;
    ApplyPatch(context.state, patch);
    if (SameState(before, context.state)) return out;

    out.push_back(StateChangedEvent(worker_id, context.state, "update", now_ms));

    if (context.state.activity != model::Activity::kInjecting && context.pending_resize) {
      InjectionRequest resize = std::move(*context.pending_resize);
      context.pending_resize.reset();
      ApplyResizeLocked(resize, now_ms, out);
    }
    RecheckLocked(context, now_ms, out);
  }
  Emit(out);
  return out;
}

std::vector<v1::Event> PaneContractEngine::Release(const std::string& worker_id, int64_t now_ms) {
  Events out;
  {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return out;
    RecheckLocked(it->second, now_ms, out);
  }
  Emit(out);
  return out;
}

std::vector<v1::Event> PaneContractEngine::Tick(int64_t now_ms) {
  Events out;
  {
    std::lock_guard lock(mutex_);
    if (safe_mode_ && now_ms >= safe_mode_until_) ExitSafeModeLocked(now_ms, out);

    while (!violation_times_.empty() && now_ms - violation_times_.front() > options_.safe_mode_window_ms) {
      violation_times_.pop_front();
    }

    for (auto& [_, context] : workers_) RecheckLocked(context, now_ms, out);
  }
  Emit(out);
  return out;
}

std::vector<v1::Event> PaneContractEngine::ResetWorker(const std::string& worker_id, int64_t now_ms) {
  Events out;
  {
    std::lock_guard lock(mutex_);
    WorkerContext& context = ContextLocked(worker_id);

    for (const auto& deferred : context.deferred) DropDeferredLocked(deferred, "worker_restart", now_ms, out);

    if (context.pending_resize) {
      DeferredRequest pending;
      pending.request        = *context.pending_resize;
      pending.deferred_at_ms = now_ms;
      pending.last_event_id  = pending.request.request_id;
      DropDeferredLocked(pending, "worker_restart", now_ms, out);
    }

    // applied work that never completed is cancelled explicitly
    for (const auto& [op, slot] : context.in_flight) {
      out.push_back(model::EventBuilder("inject.dropped", v1::STAGE_INJECT, kSource, now_ms)
                        .ParentId(slot.trace_id, slot.request_id)
                        .Worker(worker_id)
                        .Status(v1::EVENT_STATUS_DROPPED)
                        .Field("reason", "worker_restart")
                        .Field("originalEventId", slot.request_id)
                        .Field("operation", OperationClassName(op))
                        .Field("inFlight", true)
                        .Build());
    }

    context                       = WorkerContext{};
    context.worker_id             = worker_id;
    context.state.gates.safe_mode = safe_mode_;
    out.push_back(StateChangedEvent(worker_id, context.state, "worker_restart", now_ms));
  }
  Emit(out);
  return out;
}

model::PaneStateVector PaneContractEngine::State(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto it = workers_.find(worker_id);
  if (it != workers_.end()) return it->second.state;

  model::PaneStateVector state;
  state.gates.safe_mode = safe_mode_;
  return state;
}

std::size_t PaneContractEngine::DeferredCount(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto it = workers_.find(worker_id);
  return it == workers_.end() ? 0 : it->second.deferred.size();
}

bool PaneContractEngine::InSafeMode() const {
  std::lock_guard lock(mutex_);
  return safe_mode_;
}

WorkerContext& PaneContractEngine::ContextLocked(const std::string& worker_id) {
  auto [it, inserted] = workers_.try_emplace(worker_id);
  if (inserted) {
    it->second.worker_id             = worker_id;
    it->second.state.gates.safe_mode = safe_mode_;
  }
  return it->second;
}

PaneContractEngine::Verdict PaneContractEngine::EvaluateLocked(const InjectionRequest& request,
                                                               const WorkerContext& context) const {
  Verdict verdict;
  for (const auto& contract : contracts_) {
    if (!contract->AppliesTo(request)) continue;
    auto violation = contract->Check(request, context);
    if (!violation) continue;

    if (violation->bypassable && request.priority == Priority::kHigh) {
      verdict.bypassed.push_back(std::move(*violation));
    } else {
      verdict.blocking.push_back(std::move(*violation));
    }
  }
  return verdict;
}

Decision PaneContractEngine::SubmitResizeLocked(const InjectionRequest& request, WorkerContext& context,
                                                int64_t now_ms) {
  Decision decision;
  if (context.state.activity != model::Activity::kInjecting) {
    decision.outcome = Outcome::kApplied;
    ApplyResizeLocked(request, now_ms, decision.events);
    return decision;
  }

  // only the latest dimensions survive an injection
  auto builder = Chain("resize.coalesced", request, request.request_id, now_ms)
                     .Field("cols", static_cast<int64_t>(request.cols))
                     .Field("rows", static_cast<int64_t>(request.rows))
                     .Field("pending", true);
  if (context.pending_resize) builder.Field("supersededRequestId", context.pending_resize->request_id);

  context.pending_resize = request;
  decision.outcome       = Outcome::kCoalesced;
  decision.reasons       = {"injecting"};
  decision.events.push_back(builder.Build());
  return decision;
}

void PaneContractEngine::ApplyLocked(const InjectionRequest& request, WorkerContext& context,
                                     const std::string& parent_event_id, int64_t now_ms, Events& out) {
  context.in_flight[request.op] = InFlight{request.actor, request.request_id, request.trace_id, now_ms};
  context.state.activity =
      request.op == OperationClass::kControl ? model::Activity::kRecovering : model::Activity::kInjecting;

  auto builder = Chain("inject.applied", request, parent_event_id, now_ms)
                     .Status(v1::EVENT_STATUS_OK)
                     .Field("actor", request.actor)
                     .Field("priority", request.priority == Priority::kHigh ? "high" : "normal");
  if (!request.intent.empty()) builder.Field("intent", request.intent);
  out.push_back(builder.Build());
}

void PaneContractEngine::ApplyResizeLocked(const InjectionRequest& request, int64_t now_ms, Events& out) {
  out.push_back(Chain("resize.applied", request, request.request_id, now_ms)
                    .Status(v1::EVENT_STATUS_OK)
                    .Field("cols", static_cast<int64_t>(request.cols))
                    .Field("rows", static_cast<int64_t>(request.rows))
                    .Build());
}

void PaneContractEngine::RecheckLocked(WorkerContext& context, int64_t now_ms, Events& out) {
  for (auto it = context.deferred.begin(); it != context.deferred.end();) {
    DeferredRequest& deferred = *it;

    if (now_ms >= deferred.expires_at_ms) {
      DropDeferredLocked(deferred, "ttl_expired", now_ms, out);
      it = context.deferred.erase(it);
      continue;
    }

    // a re-check never counts as a violation; ownership blocks only keep it waiting
    Verdict verdict = EvaluateLocked(deferred.request, context);
    if (verdict.blocking.empty()) {
      auto resumed = Chain("inject.resumed", deferred.request, deferred.last_event_id, now_ms)
                         .Status(v1::EVENT_STATUS_OK)
                         .Field("waitedMs", now_ms - deferred.deferred_at_ms)
                         .Field("previousReasons", deferred.reasons)
                         .Build();
      std::string parent = resumed.event_id();
      out.push_back(std::move(resumed));

      if (!verdict.bypassed.empty()) {
        auto override_event = Chain("inject.override", deferred.request, parent, now_ms)
                                  .Field("bypassedGates", Reasons(verdict.bypassed))
                                  .Field("contracts", ContractIds(verdict.bypassed))
                                  .Field("intent", deferred.request.intent)
                                  .Field("actor", deferred.request.actor)
                                  .Build();
        parent = override_event.event_id();
        out.push_back(std::move(override_event));
      }

      InjectionRequest request = std::move(deferred.request);
      it                       = context.deferred.erase(it);
      ApplyLocked(request, context, parent, now_ms, out);
      continue;
    }

    auto reasons = Reasons(verdict.blocking);
    if (reasons != deferred.reasons) {
      auto event = Chain("inject.deferred", deferred.request, deferred.last_event_id, now_ms)
                       .Status(v1::EVENT_STATUS_DEFERRED)
                       .Field("reasons", reasons)
                       .Field("contracts", ContractIds(verdict.blocking))
                       .Field("ttlMs", deferred.expires_at_ms - now_ms)
                       .Field("expiresAtMs", deferred.expires_at_ms)
                       .Field("recheck", true)
                       .Build();
      deferred.last_event_id = event.event_id();
      deferred.reasons       = std::move(reasons);
      out.push_back(std::move(event));
    }
    ++it;
  }
}

void PaneContractEngine::DropDeferredLocked(const DeferredRequest& deferred, std::string_view reason, int64_t now_ms,
                                            Events& out) {
  std::string_view parent =
      deferred.last_event_id.empty() ? std::string_view(deferred.request.request_id) : deferred.last_event_id;

  out.push_back(Chain("inject.dropped", deferred.request, parent, now_ms)
                    .Status(v1::EVENT_STATUS_DROPPED)
                    .Field("reason", reason)
                    .Field("originalEventId", deferred.request.request_id)
                    .Field("deferredReasons", deferred.reasons)
                    .Field("waitedMs", now_ms - deferred.deferred_at_ms)
                    .Build());

  LEDGER_LOG_INFO("deferred request dropped", {observability::StringField("worker_id", deferred.request.worker_id),
                                               observability::StringField("request_id", deferred.request.request_id),
                                               observability::StringField("reason", reason)});
}

void PaneContractEngine::RecordViolationLocked(int64_t now_ms, Events& out) {
  violation_times_.push_back(now_ms);
  while (!violation_times_.empty() && now_ms - violation_times_.front() > options_.safe_mode_window_ms) {
    violation_times_.pop_front();
  }
  if (!safe_mode_ && violation_times_.size() >= options_.safe_mode_violations) EnterSafeModeLocked(now_ms, out);
}

void PaneContractEngine::EnterSafeModeLocked(int64_t now_ms, Events& out) {
  safe_mode_       = true;
  safe_mode_until_ = now_ms + options_.safe_mode_duration_ms;
  for (auto& [_, context] : workers_) context.state.gates.safe_mode = true;

  out.push_back(model::EventBuilder("safemode.entered", v1::STAGE_SYSTEM, kSource, now_ms)
                    .Field("reason", "cascading_violations")
                    .Field("violationCount", static_cast<int64_t>(violation_times_.size()))
                    .Field("windowMs", options_.safe_mode_window_ms)
                    .Field("untilMs", safe_mode_until_)
                    .Build());
  violation_times_.clear();

  LEDGER_LOG_WARN("safe mode entered", {observability::IntField("until_ms", safe_mode_until_)});
}

void PaneContractEngine::ExitSafeModeLocked(int64_t now_ms, Events& out) {
  safe_mode_ = false;
  for (auto& [_, context] : workers_) context.state.gates.safe_mode = false;

  out.push_back(model::EventBuilder("safemode.exited", v1::STAGE_SYSTEM, kSource, now_ms)
                    .Field("durationMs", options_.safe_mode_duration_ms)
                    .Build());

  LEDGER_LOG_INFO("safe mode exited");
}

void PaneContractEngine::Emit(const Events& events) {
  if (!sink_) return;
  for (const auto& event : events) sink_->Emit(event);
}

} // namespace ledger::contracts
