#include "internal/bridge/bridge_sender.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "internal/model/event_builder.hpp"
#include "internal/model/taxonomy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/ids.hpp"

namespace ledger::bridge {

namespace v1 = ledger::kernel::v1;

using observability::IntField;
using observability::StringField;

BridgeSender::BridgeSender(std::shared_ptr<BridgeTransport> transport, SenderOptions options,
                           util::MillisClock clock)
    : transport_(std::move(transport)), options_(std::move(options)), clock_(std::move(clock)) {
  if (options_.session_id.empty()) options_.session_id = util::NewId("ses");
}

bool BridgeSender::Enqueue(v1::Event event) {
  std::lock_guard lock(mutex_);

  const bool telemetry = model::ClassOf(event) == model::EventClass::kTelemetry;
  auto       envelope  = WrapLocked(std::move(event));

  if (queue_.size() < options_.queue_capacity) {
    queue_.push_back(std::move(envelope));
    return true;
  }

  auto victim = std::find_if(queue_.begin(), queue_.end(), [](const v1::BridgeEnvelope& e) {
    return model::ClassOf(e.event()) == model::EventClass::kTelemetry;
  });

  if (victim != queue_.end()) {
    RecordDropLocked(std::string(model::StageName(victim->event().stage())), "queue_overflow", victim->bridge_seq());
    queue_.erase(victim);
    queue_.push_back(std::move(envelope));
    return true;
  }

  if (telemetry) {
    RecordDropLocked(std::string(model::StageName(envelope.event().stage())), "queue_overflow",
                     envelope.bridge_seq());
    return false;
  }

  // contract and system envelopes are never shed for capacity
  queue_.push_back(std::move(envelope));
  return true;
}

std::size_t BridgeSender::Flush() {
  std::lock_guard flush_lock(flush_mutex_);
  if (!transport_->Connected()) return 0;

  std::size_t                     sent = 0;
  std::vector<PendingDrop>        groups;
  std::vector<v1::BridgeEnvelope> summaries;

  for (;;) {
    v1::BridgeEnvelope envelope;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) {
        // summaries are numbered behind everything already queued
        for (auto& [_, drop] : pending_drops_) groups.push_back(std::move(drop));
        pending_drops_.clear();
        for (const auto& drop : groups) summaries.push_back(WrapLocked(SummaryEvent(drop, clock_())));
        break;
      }
      envelope = std::move(queue_.front());
      queue_.pop_front();
    }

    if (!transport_->Send(envelope)) {
      std::lock_guard lock(mutex_);
      RecordDropLocked(std::string(model::StageName(envelope.event().stage())), "send_failed",
                       envelope.bridge_seq());
      LEDGER_LOG_WARN("bridge send failed", {StringField("peer_id", options_.peer_id),
                                             IntField("bridge_seq", static_cast<int64_t>(envelope.bridge_seq()))});
      return sent;
    }

    std::lock_guard lock(mutex_);
    ++forwarded_count_;
    last_forwarded_ms_ = clock_();
    ++sent;
  }

  for (std::size_t i = 0; i < summaries.size(); ++i) {
    if (!transport_->Send(summaries[i])) {
      std::lock_guard lock(mutex_);
      for (std::size_t j = i; j < groups.size(); ++j) RestoreDropLocked(groups[j]);
      LEDGER_LOG_WARN("bridge drop summary not delivered", {StringField("peer_id", options_.peer_id)});
      return sent;
    }
    ++sent;
  }
  return sent;
}

v1::BridgeDiagnostics BridgeSender::Diagnostics() const {
  std::lock_guard lock(mutex_);
  v1::BridgeDiagnostics d;
  d.set_forwarded_count(forwarded_count_);
  d.set_dropped_count(dropped_count_);
  d.set_queue_depth(queue_.size());
  d.set_pending_drop_groups(pending_drops_.size());
  d.set_last_bridge_seq(next_seq_ - 1);
  d.set_last_forwarded_ms(last_forwarded_ms_);
  d.set_last_dropped_ms(last_dropped_ms_);
  return d;
}

v1::BridgeEnvelope BridgeSender::WrapLocked(v1::Event event) {
  v1::BridgeEnvelope envelope;
  envelope.set_version(kBridgeVersion);
  envelope.set_bridge_seq(next_seq_++);
  envelope.set_bridge_ts_ms(clock_());
  envelope.set_direction(options_.direction);
  envelope.set_peer_id(options_.peer_id);
  envelope.set_session_id(options_.session_id);
  if (event.direction().empty()) event.set_direction(options_.direction);
  *envelope.mutable_event() = std::move(event);
  return envelope;
}

v1::Event BridgeSender::SummaryEvent(const PendingDrop& drop, int64_t now_ms) const {
  return model::EventBuilder("event.dropped", v1::STAGE_TRANSPORT, "ledger.bridge", now_ms)
      .Status(v1::EVENT_STATUS_DROPPED)
      .Field("stage", drop.stage)
      .Field("reason", drop.reason)
      .Field("droppedCount", drop.dropped_count)
      .Field("oldestSeq", drop.oldest_seq)
      .Field("newestSeq", drop.newest_seq)
      .Field("peerId", options_.peer_id)
      .Build();
}

void BridgeSender::RecordDropLocked(const std::string& stage, const std::string& reason, uint64_t bridge_seq) {
  auto [it, inserted] = pending_drops_.try_emplace(stage + ":" + reason);
  PendingDrop& drop   = it->second;
  if (inserted) {
    drop.stage      = stage;
    drop.reason     = reason;
    drop.oldest_seq = bridge_seq;
  }
  drop.dropped_count += 1;
  drop.oldest_seq = std::min(drop.oldest_seq, bridge_seq);
  drop.newest_seq = std::max(drop.newest_seq, bridge_seq);

  ++dropped_count_;
  last_dropped_ms_ = clock_();
}

void BridgeSender::RestoreDropLocked(const PendingDrop& drop) {
  auto [it, inserted] = pending_drops_.try_emplace(drop.stage + ":" + drop.reason, drop);
  if (inserted) return;
  PendingDrop& merged = it->second;
  merged.dropped_count += drop.dropped_count;
  merged.oldest_seq = std::min(merged.oldest_seq, drop.oldest_seq);
  merged.newest_seq = std::max(merged.newest_seq, drop.newest_seq);
}

} // namespace ledger::bridge
