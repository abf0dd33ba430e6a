#include "maintenance_worker.hpp"

#include <chrono>

#include "internal/kernel/kernel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/event_store.hpp"

namespace ledger::runtime {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<kernel::Kernel> kernel, std::shared_ptr<store::EventStore> store,
                                     MaintenanceOptions options)
    : kernel_(std::move(kernel)), store_(std::move(store)), options_(options) {
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void MaintenanceWorker::RunOnce(int64_t now_ms) {
  kernel_->Tick();

  if (now_ms - last_prune_ms_ < options_.prune_interval_ms) return;
  last_prune_ms_ = now_ms;

  store_->Prune(now_ms);
  const auto closed = store_->SweepSpans(now_ms);
  if (closed > 0) {
    LEDGER_LOG_INFO("spans timed out", {observability::IntField("count", static_cast<int64_t>(closed))});
  }
}

void MaintenanceWorker::Run() {
  last_prune_ms_ = store_->NowMs();

  while (running_) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, std::chrono::milliseconds(options_.tick_interval_ms), [this] { return !running_; });
    }
    if (!running_) break;

    try {
      RunOnce(store_->NowMs());
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("maintenance pass failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace ledger::runtime
