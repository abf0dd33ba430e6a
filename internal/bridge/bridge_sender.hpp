#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/bridge/transport.hpp"
#include "internal/util/time.hpp"
#include "ledger/kernel/v1/bridge.pb.h"

namespace ledger::bridge {

struct SenderOptions {
  std::size_t queue_capacity = 1024;
  std::string peer_id        = "ledgerd";
  std::string direction      = "kernel->peer";
  // minted at construction when empty
  std::string session_id;
};

/*
  Outbound side of the bridge.

  Every envelope gets the next bridge_seq when it is enqueued, and the
  session id of this sender instance. When the
  queue is full the oldest telemetry envelope is evicted; contract and
  system envelopes are never shed for capacity. Drops are grouped by
  (stage, reason) and go out as event.dropped summaries once the queue
  has drained, numbered after it, so the receiver sees both the gap and
  its explanation in sequence order.
*/
class BridgeSender {
 public:
  BridgeSender(std::shared_ptr<BridgeTransport> transport, SenderOptions options,
               util::MillisClock clock = util::SystemMillisClock());

  BridgeSender(const BridgeSender&)            = delete;
  BridgeSender& operator=(const BridgeSender&) = delete;

  // false when the event itself was shed
  bool Enqueue(ledger::kernel::v1::Event event);

  // sends queued envelopes, then drop summaries; stops at the first failed send
  std::size_t Flush();

  ledger::kernel::v1::BridgeDiagnostics Diagnostics() const;

  const std::string& session_id() const { return options_.session_id; }

 private:
  struct PendingDrop {
    std::string stage;
    std::string reason;
    uint64_t    dropped_count = 0;
    uint64_t    oldest_seq    = 0;
    uint64_t    newest_seq    = 0;
  };

  ledger::kernel::v1::BridgeEnvelope WrapLocked(ledger::kernel::v1::Event event);
  ledger::kernel::v1::Event          SummaryEvent(const PendingDrop& drop, int64_t now_ms) const;
  void RecordDropLocked(const std::string& stage, const std::string& reason, uint64_t bridge_seq);
  void RestoreDropLocked(const PendingDrop& drop);

  std::shared_ptr<BridgeTransport> transport_;
  SenderOptions                    options_;
  util::MillisClock                clock_;

  std::mutex flush_mutex_;

  mutable std::mutex                             mutex_;
  std::deque<ledger::kernel::v1::BridgeEnvelope> queue_;
  std::map<std::string, PendingDrop>             pending_drops_;
  uint64_t                                       next_seq_          = 1;
  uint64_t                                       forwarded_count_   = 0;
  uint64_t                                       dropped_count_     = 0;
  int64_t                                        last_forwarded_ms_ = 0;
  int64_t                                        last_dropped_ms_   = 0;
};

} // namespace ledger::bridge
