#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ledger/kernel/v1/bridge.pb.h"

namespace ledger::bridge {

struct ReceiveResult {
  bool        accepted = false;
  std::string reason;
  // the carried event, direction filled from the envelope
  std::optional<ledger::kernel::v1::Event> event;
  // bridge.connected / event.dropped produced while receiving, appended before the event
  std::vector<ledger::kernel::v1::Event> diagnostics;
};

/*
  Inbound side of the bridge. Tracks the last bridge_seq per peer and
  sender session.

  A gap becomes event.dropped{reason=sequence_gap} with the missing range.
  Disconnect keeps the tracking state; the next envelope or Connect
  emits bridge.connected{resumeFromSeq}. A new session_id from a known
  peer is a sender restart: bridge.connected{reason=sender_restart} and
  tracking starts over at 1. Envelopes without a session id fall back to
  treating sequence 1 after a higher sequence as a reset.

  Every rejected envelope leaves an event.dropped{reason} diagnostic.
*/
class BridgeReceiver {
 public:
  ReceiveResult Receive(const ledger::kernel::v1::BridgeEnvelope& envelope, int64_t now_ms);

  std::vector<ledger::kernel::v1::Event> Connect(const std::string& peer_id, int64_t now_ms);
  std::vector<ledger::kernel::v1::Event> Disconnect(const std::string& peer_id, std::string_view reason,
                                                    int64_t now_ms);

  uint64_t LastSeq(const std::string& peer_id) const;
  bool     IsConnected(const std::string& peer_id) const;

 private:
  struct PeerState {
    uint64_t    last_seq  = 0;
    bool        connected = false;
    uint64_t    gaps      = 0;
    std::string session_id;
  };

  static ReceiveResult Rejected(const ledger::kernel::v1::BridgeEnvelope& envelope, const std::string& peer_id,
                                std::string_view reason, int64_t now_ms);

  ledger::kernel::v1::Event ConnectedEvent(const std::string& peer_id, const PeerState& peer, std::string_view reason,
                                           int64_t now_ms) const;

  mutable std::mutex                         mutex_;
  std::unordered_map<std::string, PeerState> peers_;
};

} // namespace ledger::bridge
