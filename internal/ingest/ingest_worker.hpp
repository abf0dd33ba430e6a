#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "ingest_queue.hpp"

namespace ledger::ingest {

/*
  Background worker draining the ingest queue into the append path.
*/
class IngestWorker {
 public:
  using Handler = std::function<void(const ledger::kernel::v1::Event&)>;

  IngestWorker(std::shared_ptr<IngestQueue> queue, Handler handler);
  ~IngestWorker();

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  void Run();

  std::shared_ptr<IngestQueue> queue_;
  Handler                      handler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace ledger::ingest
