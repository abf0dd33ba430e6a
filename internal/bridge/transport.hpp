#pragma once

#include "ledger/kernel/v1/bridge.pb.h"

namespace ledger::bridge {

inline constexpr uint32_t kBridgeVersion = 1;

/*
  One direction of a process boundary. Implementations: the gRPC client
  in client/cpp and in-process fakes in tests.
*/
class BridgeTransport {
 public:
  virtual ~BridgeTransport() = default;

  virtual bool Connected() const = 0;

  // false when the envelope did not reach the other side or was rejected there
  virtual bool Send(const ledger::kernel::v1::BridgeEnvelope& envelope) = 0;
};

} // namespace ledger::bridge
