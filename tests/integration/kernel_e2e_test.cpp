#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/bridge/ack.hpp"
#include "internal/bridge/transport.hpp"
#include "internal/kernel/kernel.hpp"
#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"
#include "internal/query/trace_query.hpp"

namespace {

using namespace ledger::kernel::v1;
using ledger::kernel::InjectionSpec;
using ledger::kernel::Kernel;
using ledger::model::EventBuilder;

constexpr const char* kSummaryChunk = "## Summary of the conversation\nCompacting conversation...";

struct Harness {
  std::shared_ptr<int64_t>                          now = std::make_shared<int64_t>(100'000);
  std::shared_ptr<ledger::store::EventStore>        store;
  std::unique_ptr<Kernel>                           kernel;
  std::unique_ptr<ledger::query::TraceQueryEngine> queries;

  Harness() {
    auto clock = [now = now] { return *now; };

    ledger::store::StoreOptions options;
    options.durable = false;
    store           = ledger::store::EventStore::Open(options, clock);
    kernel          = std::make_unique<Kernel>(store, ledger::kernel::KernelOptions{}, clock);
    queries         = std::make_unique<ledger::query::TraceQueryEngine>(store);
    kernel->Start();
  }

  ~Harness() {
    kernel->Stop();
  }

  void Advance(int64_t ms) {
    *now += ms;
  }

  std::vector<Event> OfType(const std::string& type) {
    EventFilter filter;
    filter.set_type(type);
    auto listed = queries->QueryEvents(filter);
    return std::vector<Event>(listed.events().begin(), listed.events().end());
  }
};

std::vector<std::string> Types(const TraceReconstruction& trace) {
  std::vector<std::string> types;
  for (const auto& event : trace.events()) types.push_back(event.type());
  return types;
}

std::set<std::string> TypeSet(const TraceReconstruction& trace) {
  auto types = Types(trace);
  return std::set<std::string>(types.begin(), types.end());
}

InjectionSpec Injection(const std::string& worker) {
  InjectionSpec spec;
  spec.worker_id = worker;
  spec.actor     = "ui";
  spec.source    = "ui.composer";
  return spec;
}

void TestCleanInjectionChain() {
  Harness h;

  auto injection = h.kernel->RequestInjection(Injection("1"));
  assert(injection.request.accepted);
  assert(injection.decision.has_value());
  assert(injection.decision->outcome == ledger::contracts::Outcome::kApplied);
  const Event applied = injection.decision->events.at(0);
  assert(applied.type() == "inject.applied");
  const std::string trace_id = injection.request.trace_id;
  assert(applied.trace_id() == trace_id);

  h.Advance(10);
  auto sent = EventBuilder("inject.submit.sent", STAGE_TRANSPORT, "ui.composer", *h.now).Parent(applied).Worker("1")
                  .Build();
  assert(h.kernel->Publish(sent).accepted);

  h.Advance(5);
  auto ack = ledger::bridge::BuildAck(sent, ACK_STATUS_ACCEPTED, "", "daemon", *h.now);
  assert(h.kernel->Publish(ack).accepted);

  h.Advance(20);
  auto verified = EventBuilder("inject.verified", STAGE_VERIFY, "ui.composer", *h.now)
                      .Parent(ack)
                      .Worker("1")
                      .Status(EVENT_STATUS_OK)
                      .Build();
  assert(h.kernel->Publish(verified).accepted);
  h.kernel->Flush();

  assert(h.kernel->Contracts().State("1").activity == ledger::model::Activity::kIdle);

  auto trace = h.queries->QueryTrace(trace_id);
  assert((Types(trace) == std::vector<std::string>{"inject.requested", "inject.applied", "inject.submit.sent",
                                                   "daemon.write.ack", "inject.verified"}));
  assert(trace.orphans_size() == 0);
  assert(trace.duplicate_roots_size() == 0);

  bool ack_edge = false;
  for (const auto& edge : trace.edges()) {
    if (edge.type() == EDGE_TYPE_ACK_OF && edge.to_event_id() == ack.event_id()) ack_edge = true;
  }
  assert(ack_edge);

  auto journey = h.queries->QueryJourney(trace_id);
  assert(journey.steps_size() == 7);
  assert(journey.steps(0).mark() == JOURNEY_MARK_SEEN);     // ingress
  assert(journey.steps(1).mark() == JOURNEY_MARK_INFERRED); // route
  assert(journey.steps(2).mark() == JOURNEY_MARK_SEEN);     // inject
  assert(journey.steps(3).mark() == JOURNEY_MARK_SEEN);     // transport
  assert(journey.steps(5).mark() == JOURNEY_MARK_SEEN);     // ack
  assert(journey.steps(6).mark() == JOURNEY_MARK_SEEN);     // verify
  assert(journey.steps(6).delta_ms() == 20);

  FailureQuery failures;
  failures.set_trace_id(trace_id);
  assert(!h.queries->QueryFailurePath(failures).found());
}

void TestFocusLockDefersUntilRelease() {
  Harness h;

  auto locked = EventBuilder("focus.locked", STAGE_SYSTEM, "ui.focus", *h.now).Worker("1").Build();
  assert(h.kernel->Publish(locked).accepted);

  h.Advance(10);
  auto injection = h.kernel->RequestInjection(Injection("1"));
  assert(injection.decision->outcome == ledger::contracts::Outcome::kDeferred);
  assert(injection.decision->reasons == std::vector<std::string>{"focus_lock"});
  assert(h.kernel->Contracts().DeferredCount("1") == 1);

  h.Advance(250);
  auto released = EventBuilder("focus.released", STAGE_SYSTEM, "ui.focus", *h.now).Worker("1").Build();
  assert(h.kernel->Publish(released).accepted);
  h.kernel->Flush();

  assert(h.kernel->Contracts().DeferredCount("1") == 0);

  auto trace = h.queries->QueryTrace(injection.request.trace_id);
  auto types = TypeSet(trace);
  assert(types.count("inject.requested") == 1);
  assert(types.count("inject.deferred") == 1);
  assert(types.count("inject.resumed") == 1);
  assert(types.count("inject.applied") == 1);
  assert(trace.orphans_size() == 0);

  // deferral and resumption are both on record with their reasons
  for (const auto& event : trace.events()) {
    if (event.type() == "inject.deferred") {
      assert(event.status() == EVENT_STATUS_DEFERRED);
    }
    if (event.type() == "inject.resumed") {
      assert(ledger::model::NumberField(event.payload(), "waitedMs").value() == 250);
    }
  }
  assert(h.OfType("pane.state.changed").size() >= 2);
}

void TestCompactionGatesInjection() {
  Harness h;

  h.kernel->ObserveOutput("2", kSummaryChunk);
  h.Advance(300);
  h.kernel->ObserveOutput("2", kSummaryChunk);
  h.Advance(100);
  h.kernel->ObserveOutput("2", kSummaryChunk);
  h.Advance(100);
  h.kernel->ObserveOutput("2", kSummaryChunk);
  assert(h.kernel->Detector().State("2") == ledger::model::CompactionState::kConfirmed);
  assert(h.kernel->Contracts().State("2").gates.compacting == ledger::model::CompactionState::kConfirmed);

  h.Advance(50);
  auto injection = h.kernel->RequestInjection(Injection("2"));
  assert(injection.decision->outcome == ledger::contracts::Outcome::kDeferred);
  assert(injection.decision->reasons == std::vector<std::string>{"compaction_gate"});

  h.Advance(1000);
  h.kernel->ObserveOutput("2", "done.\nuser@host:~$ ");
  h.kernel->Flush();
  assert(h.kernel->Detector().State("2") == ledger::model::CompactionState::kCooldown);
  assert(h.kernel->Contracts().DeferredCount("2") == 0);

  auto trace = h.queries->QueryTrace(injection.request.trace_id);
  assert(TypeSet(trace).count("inject.applied") == 1);

  assert(h.OfType("cli.compaction.suspected").size() == 1);
  assert(h.OfType("cli.compaction.started").size() == 1);
  auto ended = h.OfType("cli.compaction.ended");
  assert(ended.size() == 1);
  assert(ledger::model::StringField(ended[0].payload(), "endReason").value() == "prompt_ready");

  // output is stored as metadata only outside dev mode
  auto chunks = h.OfType("pty.data.received");
  assert(chunks.size() == 5);
  assert(!ledger::model::StringField(chunks[0].payload(), "data").has_value());

  h.Advance(1500);
  h.kernel->Tick();
  h.kernel->Flush();
  assert(h.OfType("cli.compaction.cleared").size() == 1);
  assert(h.kernel->Detector().State("2") == ledger::model::CompactionState::kNone);
}

BridgeEnvelope Envelope(uint64_t seq, const Event& event, const std::string& session = "") {
  BridgeEnvelope envelope;
  envelope.set_version(ledger::bridge::kBridgeVersion);
  envelope.set_bridge_seq(seq);
  envelope.set_direction("ui->kernel");
  envelope.set_peer_id("ui");
  envelope.set_session_id(session);
  *envelope.mutable_event() = event;
  return envelope;
}

void TestBridgeDisconnectLeavesGapOnRecord() {
  Harness h;

  auto root = EventBuilder("inject.requested", STAGE_INGRESS, "ui.composer", *h.now).Build();
  assert(h.kernel->ReceiveEnvelope(Envelope(1, root)).accepted);

  h.Advance(10);
  auto routed = EventBuilder("route.selected", STAGE_ROUTE, "ui.router", *h.now).Parent(root).Build();
  assert(h.kernel->ReceiveEnvelope(Envelope(2, routed)).accepted);

  h.Advance(10);
  h.kernel->BridgeDisconnected("ui", "socket_closed");

  // envelopes 3 and 4 never arrive
  h.Advance(500);
  auto late = EventBuilder("inject.submit.sent", STAGE_TRANSPORT, "ui.composer", *h.now).Parent(routed).Build();
  auto back = h.kernel->ReceiveEnvelope(Envelope(5, late));
  assert(back.accepted);
  assert(back.diagnostics.size() == 2);
  h.kernel->Flush();

  assert(h.kernel->Receiver().IsConnected("ui"));
  assert(h.kernel->Receiver().LastSeq("ui") == 5);

  auto disconnected = h.OfType("bridge.disconnected");
  assert(disconnected.size() == 1);
  assert(ledger::model::StringField(disconnected[0].payload(), "reason").value() == "socket_closed");

  auto dropped = h.OfType("event.dropped");
  assert(dropped.size() == 1);
  assert(ledger::model::StringField(dropped[0].payload(), "reason").value() == "sequence_gap");
  assert(ledger::model::NumberField(dropped[0].payload(), "droppedCount").value() == 2);
  assert(disconnected[0].timestamp_ms() < dropped[0].timestamp_ms());

  auto connected = h.OfType("bridge.connected");
  assert(connected.size() == 2);
  assert(ledger::model::StringField(connected[1].payload(), "reason").value() == "reconnected");

  // diagnostics stay out of the trace; the three carried events keep their direction
  auto trace = h.queries->QueryTrace(root.trace_id());
  assert((Types(trace) == std::vector<std::string>{"inject.requested", "route.selected", "inject.submit.sent"}));
  assert(trace.orphans_size() == 0);
  for (const auto& event : trace.events()) assert(event.direction() == "ui->kernel");
}

void TestRestartedSenderIsAcceptedAndStaleIsRecorded() {
  Harness h;

  // two runs of a one-shot publisher: each starts at sequence 1
  auto first = EventBuilder("operator.note", STAGE_INGRESS, "ledgerctl", *h.now).Build();
  assert(h.kernel->ReceiveEnvelope(Envelope(1, first, "ses_a")).accepted);

  h.Advance(10);
  auto second = EventBuilder("operator.note", STAGE_INGRESS, "ledgerctl", *h.now).Build();
  auto restarted = h.kernel->ReceiveEnvelope(Envelope(1, second, "ses_b"));
  assert(restarted.accepted);

  // a replay inside the new session is rejected, but not silently
  h.Advance(10);
  auto replay = EventBuilder("operator.note", STAGE_INGRESS, "ledgerctl", *h.now).Build();
  auto stale  = h.kernel->ReceiveEnvelope(Envelope(1, replay, "ses_b"));
  assert(!stale.accepted);
  assert(stale.reason == "stale_sequence");
  h.kernel->Flush();

  assert(h.store->GetEvent(first.event_id()).has_value());
  assert(h.store->GetEvent(second.event_id()).has_value());
  assert(!h.store->GetEvent(replay.event_id()).has_value());

  auto connected = h.OfType("bridge.connected");
  assert(connected.size() == 2);
  assert(ledger::model::StringField(connected[1].payload(), "reason").value() == "sender_restart");
  assert(ledger::model::StringField(connected[1].payload(), "previousSessionId").value() == "ses_a");

  auto dropped = h.OfType("event.dropped");
  assert(dropped.size() == 1);
  assert(ledger::model::StringField(dropped[0].payload(), "reason").value() == "stale_sequence");
  assert(ledger::model::StringField(dropped[0].payload(), "droppedEventId").value() == replay.event_id());
  assert(ledger::model::StringField(dropped[0].payload(), "sessionId").value() == "ses_b");
}

void TestDuplicatePublishReactsOnce() {
  Harness h;

  auto request = EventBuilder("inject.requested", STAGE_INGRESS, "ui.composer", *h.now)
                     .Worker("1")
                     .Field("actor", "ui")
                     .Build();
  auto first = h.kernel->Publish(request);
  assert(first.accepted);
  h.kernel->Flush();

  // a producer retry with the same eventId
  h.Advance(10);
  auto again = h.kernel->Publish(request);
  assert(!again.accepted);
  assert(again.reason == "duplicate");
  assert(again.event_id == request.event_id());
  h.kernel->Flush();

  assert(h.OfType("inject.requested").size() == 1);
  assert(h.OfType("inject.applied").size() == 1);
  assert(h.store->Status().duplicate_count() == 1);

  // over the bridge the duplicate is reported with its own reason
  auto bridged = h.kernel->ReceiveEnvelope(Envelope(1, request));
  assert(!bridged.accepted);
  assert(bridged.reason == "duplicate");
  h.kernel->Flush();
  assert(h.OfType("inject.applied").size() == 1);

  // a fresh kernel over the same store has no memory of the id; the store does
  Kernel restarted(h.store, ledger::kernel::KernelOptions{}, [now = h.now] { return *now; });
  auto   replay = restarted.Publish(request);
  assert(!replay.accepted);
  assert(replay.reason == "duplicate");
  restarted.Flush();
  assert(h.OfType("inject.applied").size() == 1);
  assert(h.store->Status().duplicate_count() == 3);
}

void TestInvalidEventIsRecorded() {
  Harness h;

  Event bad;
  bad.set_event_id("bad-1");
  bad.set_type("NotDotted");
  bad.set_trace_id("trc_x");
  bad.set_source("ui");
  bad.set_timestamp_ms(*h.now);
  auto result = h.kernel->Publish(bad);
  assert(!result.accepted);
  assert(!result.errors.empty());
  h.kernel->Flush();

  auto invalid = h.OfType("event.invalid");
  assert(invalid.size() == 1);
  assert(!h.store->GetEvent("bad-1").has_value());
}

} // namespace

int main() {
  TestCleanInjectionChain();
  TestFocusLockDefersUntilRelease();
  TestCompactionGatesInjection();
  TestBridgeDisconnectLeavesGapOnRecord();
  TestRestartedSenderIsAcceptedAndStaleIsRecorded();
  TestDuplicatePublishReactsOnce();
  TestInvalidEventIsRecorded();
  std::cout << "ledger_integration_kernel_e2e: pass\n";
  return 0;
}
