#include "ingest_worker.hpp"

#include "internal/observability/logging.hpp"

namespace ledger::ingest {

IngestWorker::IngestWorker(std::shared_ptr<IngestQueue> queue, Handler handler)
    : queue_(std::move(queue)), handler_(std::move(handler)) {
}

IngestWorker::~IngestWorker() {
  Stop();
}

void IngestWorker::Start() {
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&IngestWorker::Run, this);
}

void IngestWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void IngestWorker::Run() {
  // keeps draining after shutdown until the queue is empty
  while (true) {
    auto event = queue_->Dequeue();
    if (!event) break;

    try {
      handler_(*event);
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("ingest append failed", {observability::StringField("event_id", event->event_id()),
                                                observability::StringField("error", e.what())});
    }
    queue_->MarkDone();
  }
}

} // namespace ledger::ingest
