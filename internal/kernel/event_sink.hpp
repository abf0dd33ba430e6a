#pragma once

#include "ledger/kernel/v1/event.pb.h"

namespace ledger::kernel {

/*
  Where components hand the events they produce. The kernel's sink feeds
  the ingest queue; tests collect into a vector.

  Emit is never called while the producer holds its own lock.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(const ledger::kernel::v1::Event& event) = 0;
};

} // namespace ledger::kernel
