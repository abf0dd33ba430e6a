#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "ledger/kernel/services/v1/event_bridge_service.pb.h"
#include "ledger/kernel/v1/bridge.pb.h"
#include "service_context.hpp"

namespace ledger::service {

/*
  Inbound bridge endpoint. Envelopes go through the kernel's receiver so
  sequence gaps and reconnects are recorded in the ledger.
*/
class BridgeService {
public:
  explicit BridgeService(ServiceContext ctx);

  ledger::kernel::services::v1::PublishResponse Publish(const ledger::kernel::v1::BridgeEnvelope& req);

  // the peer's stream ended or broke
  void PeerClosed(const std::string& peer_id, std::string_view reason);

  ledger::kernel::v1::BridgeDiagnostics Diagnostics() const;

private:
  ServiceContext ctx_;

  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> last_seq_{0};
  std::atomic<int64_t>  last_accepted_ms_{0};
  std::atomic<int64_t>  last_rejected_ms_{0};
};

}
