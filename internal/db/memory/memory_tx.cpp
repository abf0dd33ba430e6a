#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  if (read_only_) {
    read_lock_ = std::shared_lock<std::shared_mutex>(repo_.state_mutex_);
  } else {
    write_lock_ = std::unique_lock<std::shared_mutex>(repo_.state_mutex_);
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  undo_.clear();
  committed_ = true;
  finished_  = true;
  Release();
}

void MemoryTransaction::Rollback() {
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.committed_);
  }
  undo_.clear();
  finished_ = true;
  Release();
}

void MemoryTransaction::Release() {
  if (write_lock_.owns_lock()) write_lock_.unlock();
  if (read_lock_.owns_lock()) read_lock_.unlock();
}

void MemoryTransaction::RecordUndo(UndoStep step) {
  undo_.push_back(std::move(step));
}

} // namespace ledger::db::memory
