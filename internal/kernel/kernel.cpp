#include "internal/kernel/kernel.hpp"

#include <exception>
#include <utility>

#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"
#include "internal/model/taxonomy.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::kernel {

namespace v1 = ledger::kernel::v1;

using model::EventKind;
using observability::StringField;

class Kernel::QueueSink final : public EventSink {
 public:
  explicit QueueSink(std::shared_ptr<ingest::IngestQueue> queue) : queue_(std::move(queue)) {
  }

  void Emit(const v1::Event& event) override {
    if (!queue_->Enqueue(event)) {
      LEDGER_LOG_WARN("kernel event after shutdown", {StringField("event_id", event.event_id()),
                                                      StringField("type", event.type())});
    }
  }

 private:
  std::shared_ptr<ingest::IngestQueue> queue_;
};

namespace {

bool IsRecoveryIntent(std::string_view intent) {
  return intent == "kill" || intent == "restart" || intent == "interrupt";
}

contracts::InjectionRequest RequestFromEvent(const v1::Event& event) {
  const auto& payload = event.payload();

  contracts::InjectionRequest request;
  request.request_id = event.event_id();
  request.trace_id   = event.trace_id();
  request.worker_id  = event.worker_id();
  request.actor      = model::StringField(payload, "actor").value_or(event.source());
  request.intent     = model::StringField(payload, "intent").value_or("");

  if (model::ParseEventKind(event.type()) == EventKind::kResizeRequested) {
    request.op   = contracts::OperationClass::kResize;
    request.cols = static_cast<uint32_t>(model::NumberField(payload, "cols").value_or(0));
    request.rows = static_cast<uint32_t>(model::NumberField(payload, "rows").value_or(0));
  } else if (model::StringField(payload, "operation").value_or("") == "control") {
    request.op = contracts::OperationClass::kControl;
  }

  if (model::StringField(payload, "priority").value_or("") == "high" || IsRecoveryIntent(request.intent)) {
    request.priority = contracts::Priority::kHigh;
  }
  return request;
}

} // namespace

Kernel::Kernel(std::shared_ptr<store::EventStore> store, KernelOptions options, util::MillisClock clock)
    : store_(std::move(store)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      queue_(std::make_shared<ingest::IngestQueue>(options_.ingest_capacity, clock_)),
      sink_(std::make_shared<QueueSink>(queue_)),
      contracts_(std::make_unique<contracts::PaneContractEngine>(options_.contracts, sink_)),
      detector_(options_.detector) {
  worker_ = std::make_unique<ingest::IngestWorker>(queue_, [this](const v1::Event& event) { Persist(event); });
}

Kernel::~Kernel() {
  Stop();
}

void Kernel::Start() {
  worker_->Start();
}

void Kernel::Stop() {
  if (worker_) worker_->Stop();
}

PublishResult Kernel::Publish(const v1::Event& event, const ingest::NormalizeOptions& options) {
  auto normalized = ingest::Normalize(event, options);
  if (!normalized.ok) return Reject(normalized, event.event_id(), event.type());
  return Accept(normalized.event);
}

PublishResult Kernel::PublishRaw(const google::protobuf::Struct& raw, const ingest::NormalizeOptions& options) {
  auto normalized = ingest::Normalize(raw, options);
  if (!normalized.ok) {
    return Reject(normalized, model::StringField(raw, "eventId").value_or(""),
                  model::StringField(raw, "type").value_or(""));
  }
  return Accept(normalized.event);
}

InjectionResult Kernel::RequestInjection(const InjectionSpec& spec) {
  const int64_t now_ms = clock_();
  const bool    resize = spec.op == contracts::OperationClass::kResize;

  model::EventBuilder builder(resize ? "resize.requested" : "inject.requested", v1::STAGE_INGRESS, spec.source,
                              now_ms);
  if (!spec.parent_event_id.empty()) {
    builder.ParentId(spec.trace_id, spec.parent_event_id);
  } else if (!spec.trace_id.empty()) {
    builder.Trace(spec.trace_id);
  }
  for (const auto& [key, value] : spec.payload.fields()) builder.Field(key, value);
  builder.Worker(spec.worker_id)
      .Field("actor", spec.actor)
      .Field("operation", contracts::OperationClassName(spec.op))
      .Field("priority", spec.priority == contracts::Priority::kHigh ? "high" : "normal");
  if (!spec.intent.empty()) builder.Field("intent", spec.intent);
  if (resize) {
    builder.Field("cols", static_cast<int64_t>(spec.cols)).Field("rows", static_cast<int64_t>(spec.rows));
  }

  InjectionResult result;
  auto normalized = ingest::Normalize(builder.Build(), ingest::NormalizeOptions{spec.trace_id.empty()});
  if (!normalized.ok) {
    result.request = Reject(normalized, normalized.event.event_id(), normalized.event.type());
    return result;
  }

  const v1::Event& event = normalized.event;
  result.request         = PublishResult{true, event.event_id(), event.trace_id(), {}};
  Claim(event.event_id());

  v1::Event stored = event;
  ingest::ApplySampling(&stored, options_.sampling);
  Enqueue(std::move(stored));

  if (event.worker_id().empty()) {
    LEDGER_LOG_WARN("injection request without worker", {StringField("event_id", event.event_id())});
    return result;
  }
  if (!resize) detector_.ObserveInjection(event.worker_id(), now_ms);
  result.decision = contracts_->Submit(RequestFromEvent(event), now_ms);
  return result;
}

PublishResult Kernel::ObserveOutput(const std::string& worker_id, std::string_view data, std::string_view source) {
  auto event = model::EventBuilder("pty.data.received", v1::STAGE_TERMINAL, source, clock_())
                   .Worker(worker_id)
                   .Field("data", data)
                   .Field("byteLength", static_cast<uint64_t>(data.size()))
                   .Build();
  return Publish(event, ingest::NormalizeOptions{true});
}

bridge::ReceiveResult Kernel::ReceiveEnvelope(const v1::BridgeEnvelope& envelope) {
  auto result = receiver_.Receive(envelope, clock_());
  for (auto& diagnostic : result.diagnostics) Enqueue(diagnostic);

  if (result.accepted && result.event) {
    auto published = Publish(*result.event);
    if (!published.accepted) {
      result.accepted = false;
      result.reason   = published.reason;
    }
  }
  return result;
}

void Kernel::BridgeConnected(const std::string& peer_id) {
  for (auto& event : receiver_.Connect(peer_id, clock_())) Enqueue(std::move(event));
}

void Kernel::BridgeDisconnected(const std::string& peer_id, std::string_view reason) {
  for (auto& event : receiver_.Disconnect(peer_id, reason, clock_())) Enqueue(std::move(event));
}

void Kernel::Tick() {
  const int64_t now_ms = clock_();
  contracts_->Tick(now_ms);
  for (auto& [worker_id, observation] : detector_.Tick(now_ms)) {
    ApplyObservation(worker_id, std::move(observation), now_ms);
  }
}

void Kernel::Flush() {
  if (worker_->Running()) {
    queue_->WaitIdle();
    return;
  }
  // no worker thread: drain on the caller
  while (auto event = queue_->TryDequeue()) {
    Persist(*event);
    queue_->MarkDone();
  }
}

PublishResult Kernel::Accept(const v1::Event& event) {
  const bool first = Claim(event.event_id());

  v1::Event stored = event;
  ingest::ApplySampling(&stored, options_.sampling);
  Enqueue(std::move(stored));

  if (!first) {
    LEDGER_LOG_DEBUG("duplicate event not reacted to", {StringField("event_id", event.event_id()),
                                                        StringField("type", event.type())});
    return PublishResult{false, event.event_id(), event.trace_id(), {"duplicate eventId"}, "duplicate"};
  }

  React(event);
  return PublishResult{true, event.event_id(), event.trace_id(), {}};
}

bool Kernel::Claim(const std::string& event_id) {
  {
    std::lock_guard lock(seen_mutex_);
    if (seen_ids_.count(event_id) > 0) return false;
  }
  // outside the window: the store is the authority
  try {
    if (store_->GetEnvelope(event_id)) return false;
  } catch (const std::exception& e) {
    LEDGER_LOG_WARN("duplicate lookup failed", {StringField("event_id", event_id), StringField("error", e.what())});
  }

  std::lock_guard lock(seen_mutex_);
  if (!seen_ids_.insert(event_id).second) return false;
  seen_order_.push_back(event_id);
  while (seen_order_.size() > options_.dedup_window) {
    seen_ids_.erase(seen_order_.front());
    seen_order_.pop_front();
  }
  return true;
}

PublishResult Kernel::Reject(const ingest::NormalizeResult& normalized, std::string_view event_id,
                             std::string_view type) {
  Enqueue(ingest::BuildInvalidDiagnostic(normalized.errors, event_id, type, clock_()));
  LEDGER_LOG_DEBUG("event rejected", {StringField("event_id", event_id), StringField("type", type),
                                      StringField("error", normalized.errors.empty() ? "" : normalized.errors.front())});
  return PublishResult{false, std::string(event_id), "", normalized.errors, "invalid"};
}

void Kernel::React(const v1::Event& event) {
  const std::string& worker_id = event.worker_id();
  const int64_t      now_ms    = clock_();

  switch (model::ParseEventKind(event.type())) {
    case EventKind::kInjectRequested:
      if (worker_id.empty()) break;
      detector_.ObserveInjection(worker_id, now_ms);
      contracts_->Submit(RequestFromEvent(event), now_ms);
      break;

    case EventKind::kResizeRequested:
      if (worker_id.empty()) break;
      contracts_->Submit(RequestFromEvent(event), now_ms);
      break;

    case EventKind::kInjectVerified:
    case EventKind::kInjectFailed:
      if (!worker_id.empty()) contracts_->Complete(worker_id, event.trace_id(), now_ms);
      break;

    case EventKind::kFocusLocked:
    case EventKind::kFocusReleased: {
      if (worker_id.empty()) break;
      contracts::StatePatch patch;
      patch.focus_locked = model::ParseEventKind(event.type()) == EventKind::kFocusLocked;
      contracts_->UpdateState(worker_id, patch, now_ms);
      break;
    }

    case EventKind::kBridgeConnected:
    case EventKind::kBridgeDisconnected: {
      if (worker_id.empty()) break;
      contracts::StatePatch patch;
      patch.bridge = model::ParseEventKind(event.type()) == EventKind::kBridgeConnected ? model::LinkState::kUp
                                                                                        : model::LinkState::kDown;
      contracts_->UpdateState(worker_id, patch, now_ms);
      break;
    }

    case EventKind::kWorkerRestarted:
      if (worker_id.empty()) break;
      detector_.Reset(worker_id);
      contracts_->ResetWorker(worker_id, now_ms);
      break;

    case EventKind::kOutputChunk: {
      if (worker_id.empty()) break;
      auto data = model::StringField(event.payload(), "data");
      if (!data) break;
      ApplyObservation(worker_id, detector_.ObserveChunk(worker_id, *data, now_ms), now_ms);
      break;
    }

    default:
      break;
  }
}

void Kernel::ApplyObservation(const std::string& worker_id, detector::Observation observation, int64_t now_ms) {
  for (auto& event : observation.events) Enqueue(std::move(event));
  if (!observation.gate) return;

  contracts::StatePatch patch;
  patch.compacting = *observation.gate;
  contracts_->UpdateState(worker_id, patch, now_ms);
}

void Kernel::Enqueue(v1::Event event) {
  sink_->Emit(event);
}

void Kernel::Persist(const v1::Event& event) {
  auto result = store_->Append(event);
  if (result.ok) return;

  if (result.reason == "storage_error") {
    LEDGER_LOG_ERROR("append failed", {StringField("event_id", event.event_id()),
                                       StringField("error", result.errors.empty() ? "" : result.errors.front())});
  } else {
    LEDGER_LOG_DEBUG("append rejected", {StringField("event_id", event.event_id()), StringField("reason", result.reason)});
  }
}

} // namespace ledger::kernel
