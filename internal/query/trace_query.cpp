#include "internal/query/trace_query.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/payload_fields.hpp"
#include "internal/model/taxonomy.hpp"
#include "internal/util/errors.hpp"

namespace ledger::query {

using namespace ledger::kernel::v1;

namespace {

constexpr std::array<Stage, 7> kJourneyStages = {STAGE_INGRESS,  STAGE_ROUTE, STAGE_INJECT, STAGE_TRANSPORT,
                                                 STAGE_TERMINAL, STAGE_ACK,   STAGE_VERIFY};

// reason strings carried by a payload: "reason", "reasons", "kind"
std::vector<std::string> ReasonsOf(const Event& event) {
  auto reasons = model::StringListField(event.payload(), "reasons");
  for (const char* key : {"reason", "kind"}) {
    if (auto value = model::StringField(event.payload(), key)) reasons.push_back(*value);
  }
  return reasons;
}

bool Contains(const std::vector<std::string>& values, std::string_view needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

FailureClassification Classification(std::string reason, double confidence, std::vector<std::string> inputs) {
  FailureClassification out;
  out.set_reason(std::move(reason));
  out.set_confidence(confidence);
  for (auto& input : inputs) out.add_inputs(std::move(input));
  return out;
}

bool IsFailing(const Event& event, const std::set<int>& statuses) {
  return statuses.contains(static_cast<int>(event.status()));
}

} // namespace

// ------------------------------------------------------------------
// Causal ordering
// ------------------------------------------------------------------

CausalOrder OrderCausally(const std::vector<store::StoredEvent>& events) {
  CausalOrder out;

  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < events.size(); ++i) {
    index.emplace(events[i].event.event_id(), i);
  }

  // depth per event; -1 unknown, -2 on the current walk
  std::vector<int> depth(events.size(), -1);
  for (std::size_t start = 0; start < events.size(); ++start) {
    if (depth[start] >= 0) continue;

    std::vector<std::size_t> walk;
    std::size_t              cur  = start;
    int                      base = 0;
    while (true) {
      if (depth[cur] >= 0) {
        base = depth[cur] + 1;
        break;
      }
      if (depth[cur] == -2) {
        // cycle: the event that closed it ranks as a root
        base = 0;
        break;
      }
      depth[cur] = -2;
      walk.push_back(cur);

      const auto& parent = events[cur].event.parent_event_id();
      auto        it     = parent.empty() ? index.end() : index.find(parent);
      if (it == index.end()) {
        base = 0;
        break;
      }
      cur = it->second;
    }

    // walk holds the chain child..ancestor; assign from the ancestor end
    int d = base;
    for (auto it = walk.rbegin(); it != walk.rend(); ++it) {
      if (depth[*it] == -2) depth[*it] = d++;
    }
  }

  std::vector<std::size_t> order(events.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;

  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    if (depth[a] != depth[b]) return depth[a] < depth[b];
    const auto& ea = events[a];
    const auto& eb = events[b];
    if (ea.event.timestamp_ms() != eb.event.timestamp_ms()) return ea.event.timestamp_ms() < eb.event.timestamp_ms();
    return ea.row_id < eb.row_id;
  });

  // within one rank, events of a source keep their sequence order
  std::size_t level_start = 0;
  while (level_start < order.size()) {
    std::size_t level_end = level_start;
    while (level_end < order.size() && depth[order[level_end]] == depth[order[level_start]]) ++level_end;

    std::map<std::string, std::vector<std::size_t>> slots_by_source;
    for (std::size_t pos = level_start; pos < level_end; ++pos) {
      const auto& event = events[order[pos]].event;
      if (event.has_sequence()) slots_by_source[event.source()].push_back(pos);
    }
    for (auto& [source, slots] : slots_by_source) {
      if (slots.size() < 2) continue;
      std::vector<std::size_t> members;
      for (auto pos : slots) members.push_back(order[pos]);
      std::stable_sort(members.begin(), members.end(), [&](std::size_t a, std::size_t b) {
        return events[a].event.sequence() < events[b].event.sequence();
      });
      for (std::size_t i = 0; i < slots.size(); ++i) order[slots[i]] = members[i];
    }
    level_start = level_end;
  }

  out.ordered.reserve(events.size());
  for (auto i : order) {
    const auto& event = events[i].event;
    out.ordered.push_back(event);
    if (!event.parent_event_id().empty() && !index.contains(event.parent_event_id())) {
      out.orphans.push_back(event);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Failure classification
// ------------------------------------------------------------------

FailureClassification ClassifyFailure(const Event& failure, const std::vector<Event>& trace) {
  const auto reasons = ReasonsOf(failure);

  std::vector<std::string> inputs;
  inputs.push_back("type=" + failure.type());
  inputs.push_back("stage=" + std::string(model::StageName(failure.stage())));
  inputs.push_back("status=" + std::string(model::StatusName(failure.status())));
  for (const auto& reason : reasons) inputs.push_back("reason=" + reason);

  const auto kind = model::ParseEventKind(failure.type());

  if (kind == model::EventKind::kContractViolation || Contains(reasons, "ownership_conflict")) {
    return Classification("ownership_conflict", 0.9, std::move(inputs));
  }

  // the last deferral explains what the request was waiting on
  std::vector<std::string> deferred_reasons;
  for (const auto& event : trace) {
    if (model::ParseEventKind(event.type()) == model::EventKind::kInjectDeferred) {
      deferred_reasons = model::StringListField(event.payload(), "reasons");
    }
    if (event.event_id() == failure.event_id()) break;
  }
  for (const auto& reason : deferred_reasons) inputs.push_back("deferred=" + reason);

  if (Contains(reasons, "ttl_expired")) {
    return Classification("ttl_expired", deferred_reasons.empty() ? 0.7 : 0.85, std::move(inputs));
  }

  for (const char* gate : {"focus_lock", "compaction_gate", "safe_mode"}) {
    if (Contains(reasons, gate)) return Classification(gate, 0.85, std::move(inputs));
  }
  for (const char* gate : {"focus_lock", "compaction_gate", "safe_mode"}) {
    if (Contains(deferred_reasons, gate)) return Classification(gate, 0.6, std::move(inputs));
  }

  bool transport_loss = kind == model::EventKind::kEventDropped || kind == model::EventKind::kBridgeDisconnected ||
                        Contains(reasons, "sequence_gap") || Contains(reasons, "queue_overflow");
  for (const auto& event : trace) {
    const auto k = model::ParseEventKind(event.type());
    if (k == model::EventKind::kBridgeDisconnected || k == model::EventKind::kEventDropped) {
      inputs.push_back("observed=" + event.type());
      transport_loss = true;
      break;
    }
  }
  if (transport_loss) return Classification("transport_loss", 0.7, std::move(inputs));

  // a request that reached transport or terminal without any acknowledgment
  const bool awaited_ack = failure.stage() == STAGE_TRANSPORT || failure.stage() == STAGE_TERMINAL ||
                           failure.stage() == STAGE_ACK || failure.status() == EVENT_STATUS_TIMEOUT;
  const bool ack_seen    = std::any_of(trace.begin(), trace.end(), [](const Event& event) {
    return event.stage() == STAGE_ACK && event.status() == EVENT_STATUS_OK;
  });
  if (awaited_ack && !ack_seen) {
    inputs.push_back("ack=missing");
    return Classification("ack_gap", 0.6, std::move(inputs));
  }

  return Classification("unknown", 0.2, std::move(inputs));
}

// ------------------------------------------------------------------
// Engine
// ------------------------------------------------------------------

TraceQueryEngine::TraceQueryEngine(std::shared_ptr<store::EventStore> store) : store_(std::move(store)) {
}

TraceReconstruction TraceQueryEngine::QueryTrace(const std::string& trace_id, uint32_t limit) {
  if (trace_id.empty()) throw util::InvalidArgument("trace_id is required");

  auto slice = store_->QueryByTrace(trace_id, limit);

  TraceReconstruction out;
  out.set_trace_id(trace_id);
  out.set_truncated(slice.truncated);

  auto causal = OrderCausally(slice.events);

  std::map<Stage, uint64_t> stage_counts;
  for (const auto& event : causal.ordered) {
    ++stage_counts[event.stage()];
    *out.add_events() = event;
  }
  for (const auto& orphan : causal.orphans) *out.add_orphans() = orphan;

  for (const auto& [stage, count] : stage_counts) {
    auto* entry = out.add_stage_counts();
    entry->set_stage(stage);
    entry->set_count(count);
  }

  // latency across every parent link that changes stage
  std::unordered_map<std::string, const Event*> by_id;
  for (const auto& event : causal.ordered) by_id.emplace(event.event_id(), &event);

  struct HopStats {
    uint64_t samples = 0;
    int64_t  min_ms  = 0;
    int64_t  max_ms  = 0;
    int64_t  sum_ms  = 0;
  };
  std::map<std::pair<Stage, Stage>, HopStats> hops;
  for (const auto& event : causal.ordered) {
    auto it = by_id.find(event.parent_event_id());
    if (it == by_id.end() || it->second->stage() == event.stage()) continue;

    const int64_t delta = event.timestamp_ms() - it->second->timestamp_ms();
    auto&         stats = hops[{it->second->stage(), event.stage()}];
    stats.min_ms        = stats.samples == 0 ? delta : std::min(stats.min_ms, delta);
    stats.max_ms        = stats.samples == 0 ? delta : std::max(stats.max_ms, delta);
    stats.sum_ms += delta;
    ++stats.samples;
  }
  for (const auto& [pair, stats] : hops) {
    auto* hop = out.add_hop_latencies();
    hop->set_from_stage(pair.first);
    hop->set_to_stage(pair.second);
    hop->set_samples(stats.samples);
    hop->set_min_ms(stats.min_ms);
    hop->set_max_ms(stats.max_ms);
    hop->set_avg_ms(static_cast<double>(stats.sum_ms) / static_cast<double>(stats.samples));
  }

  for (const auto& edge : slice.edges) *out.add_edges() = edge;
  for (const auto& span : slice.spans) *out.add_spans() = span;
  for (std::size_t i = 1; i < slice.roots.size(); ++i) out.add_duplicate_roots(slice.roots[i]);

  return out;
}

EventList TraceQueryEngine::QueryEvents(const EventFilter& filter) {
  if (filter.has_since_ms() && filter.has_until_ms() && filter.since_ms() > filter.until_ms()) {
    throw util::InvalidArgument("since_ms is after until_ms");
  }

  auto result = store_->QueryByFilter(filter);

  EventList out;
  out.set_truncated(result.truncated);
  for (auto& stored : result.events) *out.add_events() = std::move(stored.event);
  return out;
}

FailurePath TraceQueryEngine::QueryFailurePath(const FailureQuery& query) {
  if (query.trace_id().empty() && query.worker_id().empty() && !query.has_since_ms()) {
    throw util::InvalidArgument("failure query needs a trace_id, worker_id or time window");
  }

  std::set<int> statuses;
  for (int status : query.failure_statuses()) statuses.insert(status);
  if (statuses.empty()) {
    statuses = {EVENT_STATUS_FAILED, EVENT_STATUS_DROPPED, EVENT_STATUS_TIMEOUT};
  }

  auto matches = [&](const Event& event) {
    if (!IsFailing(event, statuses)) return false;
    if (!query.worker_id().empty() && event.worker_id() != query.worker_id()) return false;
    if (query.has_since_ms() && event.timestamp_ms() < query.since_ms()) return false;
    if (query.has_until_ms() && event.timestamp_ms() >= query.until_ms()) return false;
    return true;
  };

  // without a trace, the earliest failure in the window picks the trace
  std::string trace_id = query.trace_id();
  if (trace_id.empty()) {
    EventFilter filter;
    filter.set_worker_id(query.worker_id());
    if (query.has_since_ms()) filter.set_since_ms(query.since_ms());
    if (query.has_until_ms()) filter.set_until_ms(query.until_ms());
    filter.set_limit(query.limit() == 0 ? store::kMaxFilterLimit : query.limit());

    for (const auto& stored : store_->QueryByFilter(filter).events) {
      if (matches(stored.event)) {
        trace_id = stored.event.trace_id();
        break;
      }
    }
  }

  FailurePath out;
  if (trace_id.empty()) return out;

  auto slice  = store_->QueryByTrace(trace_id, store::kMaxTraceLimit);
  auto causal = OrderCausally(slice.events);

  auto first = std::find_if(causal.ordered.begin(), causal.ordered.end(), matches);
  if (first == causal.ordered.end()) return out;

  out.set_found(true);
  *out.mutable_first_failure() = *first;

  // everything reachable from the failure over any edge type
  std::unordered_multimap<std::string, std::string> children;
  for (const auto& edge : slice.edges) children.emplace(edge.from_event_id(), edge.to_event_id());
  for (const auto& event : causal.ordered) {
    if (!event.parent_event_id().empty()) children.emplace(event.parent_event_id(), event.event_id());
  }

  std::unordered_set<std::string> impacted;
  std::deque<std::string>         frontier{first->event_id()};
  while (!frontier.empty()) {
    auto id = std::move(frontier.front());
    frontier.pop_front();
    auto [begin, end] = children.equal_range(id);
    for (auto it = begin; it != end; ++it) {
      if (it->second != first->event_id() && impacted.insert(it->second).second) frontier.push_back(it->second);
    }
  }
  for (const auto& event : causal.ordered) {
    if (impacted.contains(event.event_id())) *out.add_impacted() = event;
  }

  *out.mutable_classification() = ClassifyFailure(*first, causal.ordered);
  return out;
}

Journey TraceQueryEngine::QueryJourney(const std::string& trace_id) {
  if (trace_id.empty()) throw util::InvalidArgument("trace_id is required");

  auto slice  = store_->QueryByTrace(trace_id, store::kMaxTraceLimit);
  auto causal = OrderCausally(slice.events);

  Journey out;
  out.set_trace_id(trace_id);

  // latest journey stage that has any evidence
  int last_seen = -1;
  for (std::size_t i = 0; i < kJourneyStages.size(); ++i) {
    for (const auto& event : causal.ordered) {
      if (event.stage() == kJourneyStages[i]) last_seen = static_cast<int>(i);
    }
  }

  std::optional<int64_t> previous_ts;
  for (std::size_t i = 0; i < kJourneyStages.size(); ++i) {
    const Stage stage = kJourneyStages[i];
    auto*       step  = out.add_steps();
    step->set_stage(stage);
    step->set_name(std::string(model::StageName(stage)));

    const Event* first_event   = nullptr;
    const Event* first_failing = nullptr;
    for (const auto& event : causal.ordered) {
      if (event.stage() != stage) continue;
      if (!first_event) first_event = &event;
      if (!first_failing && model::IsFailureStatus(event.status())) first_failing = &event;
    }

    if (first_event) {
      const Event* shown = first_failing ? first_failing : first_event;
      step->set_mark(first_failing ? JOURNEY_MARK_FAILED : JOURNEY_MARK_SEEN);
      step->set_event_id(shown->event_id());
      step->set_timestamp_ms(shown->timestamp_ms());
      if (previous_ts) step->set_delta_ms(shown->timestamp_ms() - *previous_ts);
      previous_ts = shown->timestamp_ms();
    } else {
      step->set_mark(static_cast<int>(i) < last_seen ? JOURNEY_MARK_INFERRED : JOURNEY_MARK_MISSING);
    }
  }
  return out;
}

} // namespace ledger::query
