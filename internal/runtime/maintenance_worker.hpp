#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace ledger::kernel {
class Kernel;
}

namespace ledger::store {
class EventStore;
}

namespace ledger::runtime {

struct MaintenanceOptions {
  // kernel timers: defer TTL, safe mode, detector cooldown
  int64_t tick_interval_ms  = 250;
  // retention prune and span sweep
  int64_t prune_interval_ms = 60'000;
};

/*
  Background worker that drives every bounded wait in the kernel.

  Executes:
      kernel tick        every tick_interval_ms
      prune + span sweep every prune_interval_ms
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<kernel::Kernel> kernel, std::shared_ptr<store::EventStore> store,
                    MaintenanceOptions options);
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // one pass of everything due at now_ms; used by the thread and by tests
  void RunOnce(int64_t now_ms);

 private:
  void Run();

  std::shared_ptr<kernel::Kernel>    kernel_;
  std::shared_ptr<store::EventStore> store_;
  MaintenanceOptions                 options_;
  int64_t                            last_prune_ms_ = 0;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace ledger::runtime
