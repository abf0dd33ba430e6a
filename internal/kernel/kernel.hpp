#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/bridge/bridge_receiver.hpp"
#include "internal/contracts/contract_engine.hpp"
#include "internal/detector/compaction_detector.hpp"
#include "internal/ingest/ingest_queue.hpp"
#include "internal/ingest/ingest_worker.hpp"
#include "internal/ingest/normalizer.hpp"
#include "internal/kernel/event_sink.hpp"
#include "internal/store/event_store.hpp"
#include "internal/util/time.hpp"

namespace ledger::kernel {

struct KernelOptions {
  std::size_t               ingest_capacity = 10000;
  // recently accepted event ids remembered for duplicate suppression; older ids are checked in the store
  std::size_t               dedup_window = 100000;
  ingest::SamplingPolicy    sampling;
  contracts::EngineOptions  contracts;
  detector::DetectorOptions detector;
};

struct PublishResult {
  bool                     accepted = false;
  std::string              event_id;
  std::string              trace_id;
  std::vector<std::string> errors;
  // invalid | duplicate when not accepted
  std::string reason;
};

struct InjectionSpec {
  std::string worker_id;
  std::string actor;
  std::string source = "ledger.kernel";
  // continue this trace instead of minting a root
  std::string trace_id;
  std::string parent_event_id;
  contracts::OperationClass op       = contracts::OperationClass::kSubmit;
  contracts::Priority       priority = contracts::Priority::kNormal;
  std::string               intent;
  uint32_t                  cols = 0;
  uint32_t                  rows = 0;
  google::protobuf::Struct  payload;
};

struct InjectionResult {
  PublishResult                      request;
  std::optional<contracts::Decision> decision;
};

/*
  The event kernel: the one path from producers to the ledger.

  Publish normalizes, samples and queues an event for the store worker,
  then lets the contract engine and compaction detector react to it. Their
  own events go through the same queue via the kernel sink, so the log
  sees the trigger before the reaction.

  An event id the kernel has already accepted is still handed to the store,
  which counts the duplicate, but it is not reacted to again and Publish
  reports it as not accepted.

  Publish never throws into the producer and never blocks on the store.
*/
class Kernel {
 public:
  Kernel(std::shared_ptr<store::EventStore> store, KernelOptions options, util::MillisClock clock);
  ~Kernel();

  Kernel(const Kernel&)            = delete;
  Kernel& operator=(const Kernel&) = delete;

  void Start();
  void Stop();

  PublishResult Publish(const ledger::kernel::v1::Event& event, const ingest::NormalizeOptions& options = {});
  PublishResult PublishRaw(const google::protobuf::Struct& raw, const ingest::NormalizeOptions& options = {});

  // origin point: builds inject.requested (or resize.requested) and runs it through the contracts
  InjectionResult RequestInjection(const InjectionSpec& spec);

  // raw terminal output for a worker; stored as metadata only unless dev mode
  PublishResult ObserveOutput(const std::string& worker_id, std::string_view data,
                              std::string_view source = "ledger.pty");

  bridge::ReceiveResult ReceiveEnvelope(const ledger::kernel::v1::BridgeEnvelope& envelope);
  void                  BridgeConnected(const std::string& peer_id);
  void                  BridgeDisconnected(const std::string& peer_id, std::string_view reason);

  // timers: defer TTL, safe mode, detector cooldown
  void Tick();

  // waits until everything queued so far is in the store
  void Flush();

  std::shared_ptr<store::EventStore> Store() const {
    return store_;
  }

  contracts::PaneContractEngine& Contracts() {
    return *contracts_;
  }

  detector::CompactionDetector& Detector() {
    return detector_;
  }

  const bridge::BridgeReceiver& Receiver() const {
    return receiver_;
  }

  std::shared_ptr<ingest::IngestQueue> Queue() const {
    return queue_;
  }

 private:
  class QueueSink;

  PublishResult Accept(const ledger::kernel::v1::Event& event);
  bool          Claim(const std::string& event_id);
  PublishResult Reject(const ingest::NormalizeResult& normalized, std::string_view event_id, std::string_view type);
  void          React(const ledger::kernel::v1::Event& event);
  void          ApplyObservation(const std::string& worker_id, detector::Observation observation, int64_t now_ms);
  void          Enqueue(ledger::kernel::v1::Event event);
  void          Persist(const ledger::kernel::v1::Event& event);

  std::shared_ptr<store::EventStore> store_;
  KernelOptions                      options_;
  util::MillisClock                  clock_;

  std::shared_ptr<ingest::IngestQueue>           queue_;
  std::shared_ptr<EventSink>                     sink_;
  std::unique_ptr<contracts::PaneContractEngine> contracts_;
  detector::CompactionDetector                   detector_;
  bridge::BridgeReceiver                         receiver_;
  std::unique_ptr<ingest::IngestWorker>          worker_;

  std::mutex                      seen_mutex_;
  std::unordered_set<std::string> seen_ids_;
  std::deque<std::string>         seen_order_;
};

} // namespace ledger::kernel
