#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/contracts/contract_engine.hpp"
#include "internal/model/payload_fields.hpp"

namespace {

using namespace ledger::contracts;
using ledger::kernel::v1::Event;
using ledger::model::Activity;
using ledger::model::CompactionState;

class RecordingSink final : public ledger::kernel::EventSink {
 public:
  void Emit(const Event& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<Event> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

InjectionRequest Request(const std::string& id, const std::string& actor = "ui",
                         OperationClass op = OperationClass::kSubmit) {
  InjectionRequest request;
  request.request_id = id;
  request.trace_id   = "trc-" + id;
  request.worker_id  = "1";
  request.actor      = actor;
  request.op         = op;
  return request;
}

std::vector<std::string> Types(const std::vector<Event>& events) {
  std::vector<std::string> types;
  for (const auto& event : events) types.push_back(event.type());
  return types;
}

const Event* Find(const std::vector<Event>& events, const std::string& type) {
  for (const auto& event : events) {
    if (event.type() == type) return &event;
  }
  return nullptr;
}

StatePatch Focus(bool locked) {
  StatePatch patch;
  patch.focus_locked = locked;
  return patch;
}

void TestCleanRequestIsAppliedAndCompleted() {
  auto               sink = std::make_shared<RecordingSink>();
  PaneContractEngine engine({}, sink);

  auto decision = engine.Submit(Request("r1"), 1000);
  assert(decision.outcome == Outcome::kApplied);
  assert(Types(decision.events) == std::vector<std::string>{"inject.applied"});
  assert(decision.events[0].parent_event_id() == "r1");
  assert(decision.events[0].trace_id() == "trc-r1");
  assert(engine.State("1").activity == Activity::kInjecting);

  // completion by trace id, as inject.verified carries it
  engine.Complete("1", "trc-r1", 1100);
  assert(engine.State("1").activity == Activity::kIdle);

  assert(sink->Events().size() == 1);
}

void TestFocusLockDefersUntilReleased() {
  PaneContractEngine engine({}, nullptr);

  auto locked = engine.UpdateState("1", Focus(true), 1000);
  assert(Types(locked) == std::vector<std::string>{"pane.state.changed"});

  auto decision = engine.Submit(Request("r1"), 1010);
  assert(decision.outcome == Outcome::kDeferred);
  assert(decision.reasons == std::vector<std::string>{"focus_lock"});
  assert(engine.DeferredCount("1") == 1);
  const std::string deferred_id = decision.events[0].event_id();
  assert(decision.events[0].status() == ledger::kernel::v1::EVENT_STATUS_DEFERRED);

  // no change, no event
  assert(engine.UpdateState("1", Focus(true), 1020).empty());

  auto released = engine.UpdateState("1", Focus(false), 1500);
  assert((Types(released) == std::vector<std::string>{"pane.state.changed", "inject.resumed", "inject.applied"}));
  assert(released[1].parent_event_id() == deferred_id);
  assert(released[2].parent_event_id() == released[1].event_id());
  assert(ledger::model::NumberField(released[1].payload(), "waitedMs").value() == 490);
  assert(engine.DeferredCount("1") == 0);
}

void TestGatesComposeAndRecheckReportsChanges() {
  PaneContractEngine engine({}, nullptr);

  StatePatch both;
  both.focus_locked = true;
  both.compacting   = CompactionState::kConfirmed;
  engine.UpdateState("1", both, 1000);

  auto decision = engine.Submit(Request("r1"), 1001);
  assert((decision.reasons == std::vector<std::string>{"focus_lock", "compaction_gate"}));

  auto partial = engine.UpdateState("1", Focus(false), 1100);
  const Event* redeferred = Find(partial, "inject.deferred");
  assert(redeferred);
  assert(ledger::model::BoolField(redeferred->payload(), "recheck").value());
  assert(ledger::model::StringListField(redeferred->payload(), "reasons") == std::vector<std::string>{"compaction_gate"});
  assert(redeferred->parent_event_id() == decision.events[0].event_id());

  // suspected does not gate
  StatePatch suspected;
  suspected.compacting = CompactionState::kSuspected;
  auto resumed = engine.UpdateState("1", suspected, 1200);
  assert(Find(resumed, "inject.applied"));
}

void TestDeferredRequestExpires() {
  EngineOptions options;
  options.defer_ttl_ms = 500;
  PaneContractEngine engine(options, nullptr);

  engine.UpdateState("1", Focus(true), 1000);
  engine.Submit(Request("r1"), 1000);

  assert(engine.Tick(1499).empty());

  auto expired = engine.Tick(1500);
  const Event* dropped = Find(expired, "inject.dropped");
  assert(dropped);
  assert(dropped->status() == ledger::kernel::v1::EVENT_STATUS_DROPPED);
  assert(ledger::model::StringField(dropped->payload(), "reason").value() == "ttl_expired");
  assert(ledger::model::StringField(dropped->payload(), "originalEventId").value() == "r1");
  assert(engine.DeferredCount("1") == 0);
}

void TestHighPriorityBypassesGatesWithOverride() {
  PaneContractEngine engine({}, nullptr);
  engine.UpdateState("1", Focus(true), 1000);

  auto request     = Request("kill", "operator", OperationClass::kControl);
  request.priority = Priority::kHigh;
  request.intent   = "kill";

  auto decision = engine.Submit(request, 1001);
  assert(decision.outcome == Outcome::kApplied);
  assert((Types(decision.events) == std::vector<std::string>{"inject.override", "inject.applied"}));
  assert(decision.events[1].parent_event_id() == decision.events[0].event_id());
  assert(ledger::model::StringListField(decision.events[0].payload(), "bypassedGates") ==
         std::vector<std::string>{"focus_lock"});
  assert(engine.State("1").activity == Activity::kRecovering);
}

void TestOwnershipConflictBlocksOtherActors() {
  PaneContractEngine engine({}, nullptr);
  engine.Submit(Request("r1", "alice"), 1000);

  auto conflict = engine.Submit(Request("r2", "bob"), 1001);
  assert(conflict.outcome == Outcome::kDropped);
  assert((Types(conflict.events) == std::vector<std::string>{"contract.violation", "inject.dropped"}));
  assert(conflict.events[1].parent_event_id() == conflict.events[0].event_id());
  assert(ledger::model::StringField(conflict.events[0].payload(), "ownerActor").value() == "alice");
  assert(ledger::model::StringField(conflict.events[0].payload(), "ownerRequestId").value() == "r1");

  // the owner's next request waits its turn
  auto queued = engine.Submit(Request("r3", "alice"), 1002);
  assert(queued.outcome == Outcome::kDeferred);
  assert(queued.reasons == std::vector<std::string>{"in_flight"});

  auto done = engine.Complete("1", "r1", 1100);
  assert(Find(done, "inject.resumed"));
  assert(Find(done, "inject.applied"));

  // high priority never bypasses ownership
  auto urgent     = Request("r4", "bob");
  urgent.priority = Priority::kHigh;
  assert(engine.Submit(urgent, 1200).outcome == Outcome::kDropped);
}

void TestResizeCoalescesDuringInjection() {
  PaneContractEngine engine({}, nullptr);
  engine.Submit(Request("r1"), 1000);

  auto first  = Request("z1", "ui", OperationClass::kResize);
  first.cols  = 80;
  first.rows  = 24;
  auto second = Request("z2", "ui", OperationClass::kResize);
  second.cols = 120;
  second.rows = 40;

  assert(engine.Submit(first, 1001).outcome == Outcome::kCoalesced);
  auto coalesced = engine.Submit(second, 1002);
  assert(coalesced.outcome == Outcome::kCoalesced);
  assert(ledger::model::StringField(coalesced.events[0].payload(), "supersededRequestId").value() == "z1");

  auto done    = engine.Complete("1", "r1", 1100);
  const Event* applied = Find(done, "resize.applied");
  assert(applied);
  assert(ledger::model::NumberField(applied->payload(), "cols").value() == 120);
  assert(applied->parent_event_id() == "z2");

  // idle worker applies straight away
  assert(engine.Submit(first, 1200).outcome == Outcome::kApplied);
}

void TestCascadingViolationsEnterSafeMode() {
  EngineOptions options;
  options.defer_ttl_ms = 120'000;
  PaneContractEngine engine(options, nullptr);

  engine.UpdateState("1", Focus(true), 1000);
  engine.Submit(Request("a"), 1000);
  engine.Submit(Request("b"), 1001);
  auto third = engine.Submit(Request("c"), 1002);

  assert(Find(third.events, "safemode.entered"));
  assert(engine.InSafeMode());
  assert(engine.State("1").gates.safe_mode);
  assert(engine.State("other").gates.safe_mode);

  // release the focus lock: safe mode still holds the requests back
  auto partial = engine.UpdateState("1", Focus(false), 2000);
  assert(!Find(partial, "inject.applied"));
  assert(engine.DeferredCount("1") == 3);

  auto exited = engine.Tick(1002 + options.safe_mode_duration_ms);
  assert(Find(exited, "safemode.exited"));
  assert(!engine.InSafeMode());
  assert(Find(exited, "inject.applied"));
}

void TestViolationsOutsideTheWindowDoNotCascade() {
  PaneContractEngine engine({}, nullptr);
  engine.UpdateState("1", Focus(true), 0);
  engine.Submit(Request("a"), 0);
  engine.Submit(Request("b"), 5000);
  engine.Submit(Request("c"), 20000);
  assert(!engine.InSafeMode());
}

void TestWorkerRestartDropsPendingWork() {
  PaneContractEngine engine({}, nullptr);
  engine.Submit(Request("r1"), 1000);
  engine.UpdateState("1", Focus(true), 1001);
  engine.Submit(Request("r2"), 1002);

  auto reset = engine.ResetWorker("1", 1100);
  std::size_t dropped = 0;
  for (const auto& event : reset) {
    if (event.type() != "inject.dropped") continue;
    ++dropped;
    assert(ledger::model::StringField(event.payload(), "reason").value() == "worker_restart");
  }
  assert(dropped == 2);
  assert(reset.back().type() == "pane.state.changed");

  auto state = engine.State("1");
  assert(state.activity == Activity::kIdle);
  assert(!state.gates.focus_locked);
  assert(engine.DeferredCount("1") == 0);
}

} // namespace

int main() {
  TestCleanRequestIsAppliedAndCompleted();
  TestFocusLockDefersUntilReleased();
  TestGatesComposeAndRecheckReportsChanges();
  TestDeferredRequestExpires();
  TestHighPriorityBypassesGatesWithOverride();
  TestOwnershipConflictBlocksOtherActors();
  TestResizeCoalescesDuringInjection();
  TestCascadingViolationsEnterSafeMode();
  TestViolationsOutsideTheWindowDoNotCascade();
  TestWorkerRestartDropsPendingWork();

  std::cout << "ledger_unit_contract_engine: pass\n";
  return 0;
}
