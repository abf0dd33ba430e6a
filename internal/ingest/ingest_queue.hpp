#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "ledger/kernel/v1/event.pb.h"

namespace ledger::ingest {

/*
  Bounded queue in front of the single append path.

  Enqueue never blocks a producer. At capacity the oldest telemetry-class
  event is evicted (or the incoming one, when it is telemetry and nothing
  older is). Contract and system events are never dropped here; the queue
  grows past capacity for them. Every eviction is reported by an
  event.dropped summary handed out by the next Dequeue.
*/
class IngestQueue {
 public:
  IngestQueue(std::size_t capacity, util::MillisClock clock);

  // false once shut down
  bool Enqueue(ledger::kernel::v1::Event event);

  // blocking wait
  std::optional<ledger::kernel::v1::Event> Dequeue();
  std::optional<ledger::kernel::v1::Event> TryDequeue();

  // consumer reports that a dequeued event has been handled
  void MarkDone();

  // blocks until the queue is empty and nothing is in flight
  void WaitIdle();

  void Shutdown();

  std::size_t   Depth() const;
  std::uint64_t DroppedCount() const;

 private:
  struct DropSummary {
    std::uint64_t                        count{0};
    std::int64_t                         first_ms{0};
    std::int64_t                         last_ms{0};
    std::map<std::string, std::uint64_t> by_type;
  };

  void RecordDropLocked(const ledger::kernel::v1::Event& event);
  std::optional<ledger::kernel::v1::Event> TakeLocked();

  const std::size_t capacity_;
  util::MillisClock clock_;

  mutable std::mutex                    mutex_;
  std::condition_variable               cv_;
  std::condition_variable               idle_cv_;
  std::deque<ledger::kernel::v1::Event> queue_;
  DropSummary                           pending_drops_;
  std::uint64_t                         dropped_total_{0};
  std::size_t                           in_flight_{0};
  bool                                  shutdown_ = false;
};

} // namespace ledger::ingest
