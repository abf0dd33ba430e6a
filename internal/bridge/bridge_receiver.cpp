#include "internal/bridge/bridge_receiver.hpp"

#include "internal/bridge/transport.hpp"
#include "internal/model/event_builder.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::bridge {

namespace v1 = ledger::kernel::v1;

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kSource = "ledger.bridge";

} // namespace

ReceiveResult BridgeReceiver::Receive(const v1::BridgeEnvelope& envelope, int64_t now_ms) {
  const std::string peer_id = envelope.peer_id().empty() ? "unknown" : envelope.peer_id();

  if (envelope.version() != kBridgeVersion) return Rejected(envelope, peer_id, "unsupported_version", now_ms);
  if (!envelope.has_event()) return Rejected(envelope, peer_id, "missing_event", now_ms);
  if (envelope.bridge_seq() == 0) return Rejected(envelope, peer_id, "missing_sequence", now_ms);

  ReceiveResult  result;
  const uint64_t seq = envelope.bridge_seq();

  std::lock_guard lock(mutex_);
  auto [it, first_contact] = peers_.try_emplace(peer_id);
  PeerState& peer          = it->second;
  if (first_contact) peer.session_id = envelope.session_id();

  const bool new_session = !first_contact && !envelope.session_id().empty() && envelope.session_id() != peer.session_id;
  const bool legacy_reset =
      !first_contact && envelope.session_id().empty() && seq == 1 && peer.last_seq > 1;

  if (new_session || legacy_reset) {
    result.diagnostics.push_back(model::EventBuilder("bridge.connected", v1::STAGE_TRANSPORT, kSource, now_ms)
                                     .Field("peerId", peer_id)
                                     .Field("reason", new_session ? "sender_restart" : "sequence_reset")
                                     .Field("previousSeq", peer.last_seq)
                                     .Field("previousSessionId", peer.session_id)
                                     .Field("sessionId", envelope.session_id())
                                     .Field("resumeFromSeq", static_cast<uint64_t>(1))
                                     .Build());
    LEDGER_LOG_WARN("bridge sender restarted", {StringField("peer_id", peer_id),
                                                StringField("session_id", envelope.session_id()),
                                                IntField("previous_seq", static_cast<int64_t>(peer.last_seq))});
    peer.last_seq   = 0;
    peer.session_id = envelope.session_id();
    peer.connected  = true;
  } else if (!first_contact && seq <= peer.last_seq) {
    return Rejected(envelope, peer_id, "stale_sequence", now_ms);
  }

  if (!peer.connected) {
    result.diagnostics.push_back(
        ConnectedEvent(peer_id, peer, first_contact ? "first_contact" : "reconnected", now_ms));
    peer.connected = true;
  }

  // the first envelope from a peer sets the baseline
  if (!first_contact && seq > peer.last_seq + 1) {
    const uint64_t missing = seq - peer.last_seq - 1;
    result.diagnostics.push_back(model::EventBuilder("event.dropped", v1::STAGE_TRANSPORT, kSource, now_ms)
                                     .Status(v1::EVENT_STATUS_DROPPED)
                                     .Field("reason", "sequence_gap")
                                     .Field("peerId", peer_id)
                                     .Field("droppedCount", missing)
                                     .Field("oldestSeq", peer.last_seq + 1)
                                     .Field("newestSeq", seq - 1)
                                     .Build());
    ++peer.gaps;
    LEDGER_LOG_WARN("bridge sequence gap", {StringField("peer_id", peer_id),
                                            IntField("missing", static_cast<int64_t>(missing))});
  }
  peer.last_seq = seq;

  v1::Event event = envelope.event();
  if (event.direction().empty()) event.set_direction(envelope.direction());

  result.accepted = true;
  result.event    = std::move(event);
  return result;
}

ReceiveResult BridgeReceiver::Rejected(const v1::BridgeEnvelope& envelope, const std::string& peer_id,
                                       std::string_view reason, int64_t now_ms) {
  ReceiveResult result;
  result.reason = std::string(reason);

  model::EventBuilder dropped("event.dropped", v1::STAGE_TRANSPORT, kSource, now_ms);
  const auto& lost = envelope.event();
  if (!lost.trace_id().empty() && !lost.parent_event_id().empty()) {
    dropped.ParentId(lost.trace_id(), lost.parent_event_id());
  } else if (!lost.trace_id().empty()) {
    dropped.Trace(lost.trace_id());
  }
  result.diagnostics.push_back(dropped.Status(v1::EVENT_STATUS_DROPPED)
                                   .Field("reason", reason)
                                   .Field("peerId", peer_id)
                                   .Field("sessionId", envelope.session_id())
                                   .Field("droppedCount", static_cast<uint64_t>(1))
                                   .Field("oldestSeq", envelope.bridge_seq())
                                   .Field("newestSeq", envelope.bridge_seq())
                                   .Field("droppedEventId", envelope.event().event_id())
                                   .Field("droppedType", envelope.event().type())
                                   .Build());
  LEDGER_LOG_WARN("bridge envelope rejected", {StringField("peer_id", peer_id), StringField("reason", reason),
                                               IntField("bridge_seq", static_cast<int64_t>(envelope.bridge_seq()))});
  return result;
}

std::vector<v1::Event> BridgeReceiver::Connect(const std::string& peer_id, int64_t now_ms) {
  std::lock_guard lock(mutex_);
  auto [it, first_contact] = peers_.try_emplace(peer_id);
  if (it->second.connected) return {};

  it->second.connected = true;
  return {ConnectedEvent(peer_id, it->second, first_contact ? "first_contact" : "reconnected", now_ms)};
}

std::vector<v1::Event> BridgeReceiver::Disconnect(const std::string& peer_id, std::string_view reason,
                                                  int64_t now_ms) {
  std::lock_guard lock(mutex_);
  auto it = peers_.find(peer_id);
  if (it == peers_.end() || !it->second.connected) return {};

  it->second.connected = false;
  LEDGER_LOG_WARN("bridge disconnected", {StringField("peer_id", peer_id), StringField("reason", reason)});

  return {model::EventBuilder("bridge.disconnected", v1::STAGE_TRANSPORT, kSource, now_ms)
              .Status(v1::EVENT_STATUS_FAILED)
              .Field("peerId", peer_id)
              .Field("reason", reason)
              .Field("lastSeq", it->second.last_seq)
              .Build()};
}

uint64_t BridgeReceiver::LastSeq(const std::string& peer_id) const {
  std::lock_guard lock(mutex_);
  auto it = peers_.find(peer_id);
  return it == peers_.end() ? 0 : it->second.last_seq;
}

bool BridgeReceiver::IsConnected(const std::string& peer_id) const {
  std::lock_guard lock(mutex_);
  auto it = peers_.find(peer_id);
  return it != peers_.end() && it->second.connected;
}

v1::Event BridgeReceiver::ConnectedEvent(const std::string& peer_id, const PeerState& peer, std::string_view reason,
                                         int64_t now_ms) const {
  return model::EventBuilder("bridge.connected", v1::STAGE_TRANSPORT, kSource, now_ms)
      .Field("peerId", peer_id)
      .Field("reason", reason)
      .Field("resumeFromSeq", peer.last_seq + 1)
      .Field("gapsSeen", peer.gaps)
      .Build();
}

} // namespace ledger::bridge
