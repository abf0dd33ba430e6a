#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/bridge/ack.hpp"
#include "internal/bridge/bridge_receiver.hpp"
#include "internal/bridge/bridge_sender.hpp"
#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"

namespace {

using namespace ledger::bridge;
namespace v1 = ledger::kernel::v1;
using ledger::model::EventBuilder;
using ledger::model::NumberField;
using ledger::model::StringField;

class FakeTransport final : public BridgeTransport {
 public:
  bool Connected() const override {
    return connected;
  }

  bool Send(const v1::BridgeEnvelope& envelope) override {
    if (fail_next > 0) {
      --fail_next;
      return false;
    }
    sent.push_back(envelope);
    return true;
  }

  bool                            connected = true;
  int                             fail_next = 0;
  std::vector<v1::BridgeEnvelope> sent;
};

ledger::util::MillisClock FixedClock(int64_t now) {
  return [now] { return now; };
}

v1::Event Chunk() {
  return EventBuilder("pty.data.received", v1::STAGE_TERMINAL, "pty", 1000).Worker("1").Build();
}

v1::Event Request() {
  return EventBuilder("inject.requested", v1::STAGE_INGRESS, "ui", 1000).Worker("1").Build();
}

v1::BridgeEnvelope Envelope(uint64_t seq, const std::string& peer = "p") {
  v1::BridgeEnvelope envelope;
  envelope.set_version(kBridgeVersion);
  envelope.set_bridge_seq(seq);
  envelope.set_bridge_ts_ms(1000);
  envelope.set_direction("peer->kernel");
  envelope.set_peer_id(peer);
  *envelope.mutable_event() = Chunk();
  return envelope;
}

void TestSenderEvictsTelemetryAndSummarizes() {
  auto         transport = std::make_shared<FakeTransport>();
  BridgeSender sender(transport, SenderOptions{3, "ui", "ui->kernel"}, FixedClock(5000));

  assert(sender.Enqueue(Chunk()));   // seq 1
  assert(sender.Enqueue(Chunk()));   // seq 2
  assert(sender.Enqueue(Chunk()));   // seq 3
  assert(sender.Enqueue(Request())); // seq 4, evicts 1
  assert(sender.Enqueue(Chunk()));   // seq 5, evicts 2

  auto d = sender.Diagnostics();
  assert(d.dropped_count() == 2);
  assert(d.queue_depth() == 3);
  assert(d.pending_drop_groups() == 1);
  assert(d.last_bridge_seq() == 5);
  assert(d.last_dropped_ms() == 5000);

  assert(sender.Flush() == 4);
  assert(transport->sent.size() == 4);
  assert(transport->sent[0].bridge_seq() == 3);
  assert(transport->sent[1].bridge_seq() == 4);
  assert(transport->sent[1].event().type() == "inject.requested");
  assert(transport->sent[2].bridge_seq() == 5);
  assert(transport->sent[0].event().direction() == "ui->kernel");
  assert(transport->sent[0].peer_id() == "ui");

  const auto& summary = transport->sent[3];
  assert(summary.bridge_seq() == 6);
  assert(summary.event().type() == "event.dropped");
  assert(summary.event().status() == v1::EVENT_STATUS_DROPPED);
  assert(StringField(summary.event().payload(), "stage").value() == "terminal");
  assert(StringField(summary.event().payload(), "reason").value() == "queue_overflow");
  assert(NumberField(summary.event().payload(), "droppedCount").value() == 2);
  assert(NumberField(summary.event().payload(), "oldestSeq").value() == 1);
  assert(NumberField(summary.event().payload(), "newestSeq").value() == 2);

  d = sender.Diagnostics();
  assert(d.forwarded_count() == 3);
  assert(d.queue_depth() == 0);
  assert(d.pending_drop_groups() == 0);
  assert(d.last_bridge_seq() == 6);

  // what the sender emits is in order for a receiver
  BridgeReceiver receiver;
  for (const auto& envelope : transport->sent) assert(receiver.Receive(envelope, 5000).accepted);
  assert(receiver.LastSeq("ui") == 6);
}

void TestSenderNeverShedsContractEvents() {
  auto         transport = std::make_shared<FakeTransport>();
  BridgeSender sender(transport, SenderOptions{1, "ui", "ui->kernel"}, FixedClock(0));

  assert(sender.Enqueue(Request()));
  assert(!sender.Enqueue(Chunk()));
  assert(sender.Enqueue(Request()));

  auto d = sender.Diagnostics();
  assert(d.queue_depth() == 2);
  assert(d.dropped_count() == 1);
}

void TestSenderSendFailure() {
  auto         transport = std::make_shared<FakeTransport>();
  BridgeSender sender(transport, SenderOptions{16, "ui", "ui->kernel"}, FixedClock(0));

  sender.Enqueue(Request());
  sender.Enqueue(Request());
  sender.Enqueue(Request());

  transport->connected = false;
  assert(sender.Flush() == 0);
  assert(sender.Diagnostics().queue_depth() == 3);

  transport->connected = true;
  transport->sent.clear();
  assert(sender.Flush() == 3);
  transport->sent.clear();

  sender.Enqueue(Request()); // seq 4
  sender.Enqueue(Request()); // seq 5
  transport->fail_next = 1;
  assert(sender.Flush() == 0);
  assert(sender.Diagnostics().queue_depth() == 1);
  assert(sender.Diagnostics().pending_drop_groups() == 1);

  assert(sender.Flush() == 2);
  assert(transport->sent.size() == 2);
  assert(transport->sent[0].bridge_seq() == 5);
  const auto& summary = transport->sent[1].event();
  assert(summary.type() == "event.dropped");
  assert(StringField(summary.payload(), "reason").value() == "send_failed");
  assert(StringField(summary.payload(), "stage").value() == "ingress");
  assert(NumberField(summary.payload(), "oldestSeq").value() == 4);
  assert(NumberField(summary.payload(), "newestSeq").value() == 4);
}

void TestReceiverRejectsMalformedEnvelopes() {
  BridgeReceiver receiver;

  auto envelope = Envelope(1);
  envelope.set_version(2);
  assert(receiver.Receive(envelope, 0).reason == "unsupported_version");

  envelope = Envelope(1);
  envelope.clear_event();
  assert(receiver.Receive(envelope, 0).reason == "missing_event");

  envelope = Envelope(0);
  auto result = receiver.Receive(envelope, 0);
  assert(!result.accepted);
  assert(result.reason == "missing_sequence");
  assert(!result.event.has_value());
}

void TestReceiverTracksSequence() {
  BridgeReceiver receiver;

  auto first = receiver.Receive(Envelope(5), 100);
  assert(first.accepted);
  assert(first.event->direction() == "peer->kernel");
  assert(first.diagnostics.size() == 1);
  assert(first.diagnostics[0].type() == "bridge.connected");
  assert(StringField(first.diagnostics[0].payload(), "reason").value() == "first_contact");
  assert(receiver.IsConnected("p"));

  assert(receiver.Receive(Envelope(6), 110).diagnostics.empty());

  auto stale = receiver.Receive(Envelope(6), 120);
  assert(!stale.accepted);
  assert(stale.reason == "stale_sequence");

  auto gap = receiver.Receive(Envelope(9), 130);
  assert(gap.accepted);
  assert(gap.diagnostics.size() == 1);
  const auto& dropped = gap.diagnostics[0];
  assert(dropped.type() == "event.dropped");
  assert(StringField(dropped.payload(), "reason").value() == "sequence_gap");
  assert(NumberField(dropped.payload(), "droppedCount").value() == 2);
  assert(NumberField(dropped.payload(), "oldestSeq").value() == 7);
  assert(NumberField(dropped.payload(), "newestSeq").value() == 8);
  assert(receiver.LastSeq("p") == 9);
}

void TestReceiverDisconnectKeepsTracking() {
  BridgeReceiver receiver;
  receiver.Receive(Envelope(1), 0);
  receiver.Receive(Envelope(2), 10);

  auto down = receiver.Disconnect("p", "socket_closed", 20);
  assert(down.size() == 1);
  assert(down[0].type() == "bridge.disconnected");
  assert(down[0].status() == v1::EVENT_STATUS_FAILED);
  assert(NumberField(down[0].payload(), "lastSeq").value() == 2);
  assert(!receiver.IsConnected("p"));
  assert(receiver.Disconnect("p", "socket_closed", 30).empty());

  // resumes from the kept sequence; the missed range is reported
  auto back = receiver.Receive(Envelope(5), 40);
  assert(back.accepted);
  assert(back.diagnostics.size() == 2);
  assert(back.diagnostics[0].type() == "bridge.connected");
  assert(StringField(back.diagnostics[0].payload(), "reason").value() == "reconnected");
  assert(NumberField(back.diagnostics[0].payload(), "resumeFromSeq").value() == 3);
  assert(back.diagnostics[1].type() == "event.dropped");
  assert(NumberField(back.diagnostics[1].payload(), "droppedCount").value() == 2);
}

void TestReceiverReportsSenderReset() {
  BridgeReceiver receiver;
  receiver.Receive(Envelope(1), 0);
  receiver.Receive(Envelope(2), 10);
  receiver.Receive(Envelope(3), 20);

  auto reset = receiver.Receive(Envelope(1), 30);
  assert(reset.accepted);
  assert(reset.diagnostics.size() == 1);
  assert(StringField(reset.diagnostics[0].payload(), "reason").value() == "sequence_reset");
  assert(NumberField(reset.diagnostics[0].payload(), "previousSeq").value() == 3);
  assert(receiver.LastSeq("p") == 1);
}

void TestReceiverRejectionsLeaveDiagnostics() {
  BridgeReceiver receiver;

  auto envelope = Envelope(1);
  envelope.set_version(2);
  auto rejected = receiver.Receive(envelope, 0);
  assert(!rejected.accepted);
  assert(rejected.diagnostics.size() == 1);
  assert(rejected.diagnostics[0].type() == "event.dropped");
  assert(rejected.diagnostics[0].status() == v1::EVENT_STATUS_DROPPED);
  assert(StringField(rejected.diagnostics[0].payload(), "reason").value() == "unsupported_version");
  assert(StringField(rejected.diagnostics[0].payload(), "droppedEventId").value() == envelope.event().event_id());
  // keeps the carried trace so the loss shows up in it
  assert(rejected.diagnostics[0].trace_id() == envelope.event().trace_id());

  receiver.Receive(Envelope(4), 10);
  auto stale = receiver.Receive(Envelope(4), 20);
  assert(!stale.accepted);
  assert(stale.diagnostics.size() == 1);
  assert(StringField(stale.diagnostics[0].payload(), "reason").value() == "stale_sequence");
  assert(NumberField(stale.diagnostics[0].payload(), "oldestSeq").value() == 4);
  assert(StringField(stale.diagnostics[0].payload(), "peerId").value() == "p");
  assert(receiver.LastSeq("p") == 4);
}

void TestReceiverAcceptsRestartedSender() {
  auto           transport = std::make_shared<FakeTransport>();
  BridgeReceiver receiver;

  SenderOptions options;
  options.peer_id = "ledgerctl";

  // each run of a one-shot publisher is a new sender starting at 1
  for (int run = 0; run < 3; ++run) {
    BridgeSender sender(transport, options, FixedClock(1000 + run));
    assert(!sender.session_id().empty());
    sender.Enqueue(Request());
    assert(sender.Flush() == 1);
  }
  assert(transport->sent.size() == 3);
  assert(transport->sent[0].session_id() != transport->sent[1].session_id());

  auto first = receiver.Receive(transport->sent[0], 10);
  assert(first.accepted);

  auto second = receiver.Receive(transport->sent[1], 20);
  assert(second.accepted);
  assert(second.diagnostics.size() == 1);
  assert(second.diagnostics[0].type() == "bridge.connected");
  assert(StringField(second.diagnostics[0].payload(), "reason").value() == "sender_restart");
  assert(NumberField(second.diagnostics[0].payload(), "previousSeq").value() == 1);
  assert(StringField(second.diagnostics[0].payload(), "previousSessionId").value() ==
         transport->sent[0].session_id());

  assert(receiver.Receive(transport->sent[2], 30).accepted);
  assert(receiver.LastSeq("ledgerctl") == 1);

  // replaying an envelope of the current session is still stale
  assert(receiver.Receive(transport->sent[2], 40).reason == "stale_sequence");
}

void TestRestartedSenderGapCountsFromOne() {
  BridgeReceiver receiver;

  auto envelope = Envelope(7);
  envelope.set_session_id("ses_1");
  assert(receiver.Receive(envelope, 0).accepted);

  // the new session's first two envelopes were lost
  envelope = Envelope(3);
  envelope.set_session_id("ses_2");
  auto result = receiver.Receive(envelope, 10);
  assert(result.accepted);
  assert(result.diagnostics.size() == 2);
  assert(StringField(result.diagnostics[0].payload(), "reason").value() == "sender_restart");
  assert(result.diagnostics[1].type() == "event.dropped");
  assert(NumberField(result.diagnostics[1].payload(), "oldestSeq").value() == 1);
  assert(NumberField(result.diagnostics[1].payload(), "newestSeq").value() == 2);
  assert(receiver.LastSeq("p") == 3);
}

void TestSenderKeepsGivenSession() {
  auto          transport = std::make_shared<FakeTransport>();
  SenderOptions options;
  options.session_id = "ses_fixed";
  BridgeSender sender(transport, options, FixedClock(0));
  sender.Enqueue(Request());
  sender.Enqueue(Chunk());
  sender.Flush();
  assert(transport->sent.size() == 2);
  for (const auto& envelope : transport->sent) assert(envelope.session_id() == "ses_fixed");
}

void TestConnectOnce() {
  BridgeReceiver receiver;
  auto           up = receiver.Connect("q", 0);
  assert(up.size() == 1);
  assert(StringField(up[0].payload(), "peerId").value() == "q");
  assert(receiver.Connect("q", 10).empty());
  assert(receiver.IsConnected("q"));
}

void TestAckLinksBackToRequest() {
  auto request = EventBuilder("inject.submit.sent", v1::STAGE_TRANSPORT, "ui", 100).Worker("1").Build();

  auto ack = BuildAck(request, v1::ACK_STATUS_REJECTED_NOT_ALIVE, "pane exited", "daemon", 150);
  assert(ack.type() == "daemon.write.ack");
  assert(ack.stage() == v1::STAGE_ACK);
  assert(ack.trace_id() == request.trace_id());
  assert(ack.parent_event_id() == request.event_id());
  assert(ack.ack_of_event_id() == request.event_id());
  assert(ack.worker_id() == "1");
  assert(ack.status() == v1::EVENT_STATUS_FAILED);

  auto command = ToCommandAck(ack);
  assert(command.has_value());
  assert(command->request_event_id() == request.event_id());
  assert(command->trace_id() == request.trace_id());
  assert(command->status() == v1::ACK_STATUS_REJECTED_NOT_ALIVE);
  assert(command->detail() == "pane exited");

  assert(!ToCommandAck(request).has_value());

  assert(EventStatusForAck(v1::ACK_STATUS_ACCEPTED) == v1::EVENT_STATUS_OK);
  assert(EventStatusForAck(v1::ACK_STATUS_BLOCKED_DEDUP) == v1::EVENT_STATUS_DROPPED);
  assert(EventStatusForAck(v1::ACK_STATUS_ERROR) == v1::EVENT_STATUS_FAILED);

  assert(ParseAckStatus("blocked_dedup").value() == v1::ACK_STATUS_BLOCKED_DEDUP);
  assert(!ParseAckStatus("maybe").has_value());
  assert(AckStatusName(v1::ACK_STATUS_REJECTED_MODE_UNSUPPORTED) == "rejected_mode_unsupported");
}

} // namespace

int main() {
  TestSenderEvictsTelemetryAndSummarizes();
  TestSenderNeverShedsContractEvents();
  TestSenderSendFailure();
  TestReceiverRejectsMalformedEnvelopes();
  TestReceiverTracksSequence();
  TestReceiverDisconnectKeepsTracking();
  TestReceiverReportsSenderReset();
  TestReceiverRejectionsLeaveDiagnostics();
  TestReceiverAcceptsRestartedSender();
  TestRestartedSenderGapCountsFromOne();
  TestSenderKeepsGivenSession();
  TestConnectOnce();
  TestAckLinksBackToRequest();
  std::cout << "ledger_unit_bridge: pass\n";
  return 0;
}
