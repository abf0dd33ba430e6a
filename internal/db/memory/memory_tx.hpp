#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ledger::db::memory {

/*
  Transaction = lock on the state + undo log

  Writers mutate in place under the exclusive lock; Rollback (or the
  destructor) replays the undo log newest first.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using UndoStep = std::function<void(MemoryRepository::State&)>;

  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool ReadOnly() const {
    return read_only_;
  }

  MemoryRepository::State& Mutable() {
    return repo_.committed_;
  }
  const MemoryRepository::State& View() const {
    return repo_.committed_;
  }

  void RecordUndo(UndoStep step);

 private:
  void Release();

  MemoryRepository&                   repo_;
  bool                                read_only_;
  std::unique_lock<std::shared_mutex> write_lock_;
  std::shared_lock<std::shared_mutex> read_lock_;
  std::vector<UndoStep>               undo_;
  bool                                committed_ = false;
  bool                                finished_  = false;
};

} // namespace ledger::db::memory
