#include "ingest_queue.hpp"

#include <algorithm>

#include "internal/model/event_builder.hpp"
#include "internal/model/taxonomy.hpp"

namespace ledger::ingest {

using namespace ledger::kernel::v1;

IngestQueue::IngestQueue(std::size_t capacity, util::MillisClock clock)
    : capacity_(std::max<std::size_t>(capacity, 1)), clock_(std::move(clock)) {
}

bool IngestQueue::Enqueue(Event event) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;

    if (queue_.size() >= capacity_) {
      auto oldest_telemetry = std::find_if(queue_.begin(), queue_.end(), [](const Event& queued) {
        return model::ClassOf(queued) == model::EventClass::kTelemetry;
      });

      if (oldest_telemetry != queue_.end()) {
        RecordDropLocked(*oldest_telemetry);
        queue_.erase(oldest_telemetry);
      } else if (model::ClassOf(event) == model::EventClass::kTelemetry) {
        RecordDropLocked(event);
        cv_.notify_one();
        return true;
      }
    }

    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<Event> IngestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty() || pending_drops_.count > 0; });

  if (shutdown_ && queue_.empty() && pending_drops_.count == 0) return std::nullopt;

  return TakeLocked();
}

std::optional<Event> IngestQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (queue_.empty() && pending_drops_.count == 0) return std::nullopt;
  return TakeLocked();
}

void IngestQueue::MarkDone() {
  std::lock_guard lock(mutex_);
  if (in_flight_ > 0) --in_flight_;
  if (in_flight_ == 0 && queue_.empty() && pending_drops_.count == 0) idle_cv_.notify_all();
}

void IngestQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return shutdown_ || (queue_.empty() && in_flight_ == 0 && pending_drops_.count == 0); });
}

void IngestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

std::size_t IngestQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::uint64_t IngestQueue::DroppedCount() const {
  std::lock_guard lock(mutex_);
  return dropped_total_;
}

void IngestQueue::RecordDropLocked(const Event& event) {
  if (pending_drops_.count == 0) pending_drops_.first_ms = event.timestamp_ms();
  pending_drops_.last_ms = event.timestamp_ms();
  ++pending_drops_.count;
  ++pending_drops_.by_type[event.type()];
  ++dropped_total_;
}

std::optional<Event> IngestQueue::TakeLocked() {
  ++in_flight_;

  // the summary goes out ahead of anything queued after the loss
  if (pending_drops_.count > 0) {
    google::protobuf::Value by_type;
    auto*                   fields = by_type.mutable_struct_value()->mutable_fields();
    for (const auto& [type, count] : pending_drops_.by_type) {
      (*fields)[type].set_number_value(static_cast<double>(count));
    }

    auto summary = model::EventBuilder(model::EventTypeName(model::EventKind::kEventDropped), STAGE_SYSTEM,
                                       "ledger.ingest", clock_())
                       .Status(EVENT_STATUS_DROPPED)
                       .Field("reason", "queue_overflow")
                       .Field("droppedCount", pending_drops_.count)
                       .Field("oldestTimestampMs", pending_drops_.first_ms)
                       .Field("newestTimestampMs", pending_drops_.last_ms)
                       .Field("byType", by_type)
                       .Build();
    pending_drops_ = DropSummary{};
    return summary;
  }

  Event event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

} // namespace ledger::ingest
