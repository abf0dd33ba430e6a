#pragma once

namespace ledger::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one write transaction is open at a time; Begin() waits
    (bounded by the busy timeout) for the previous one

  SQLite: BEGIN IMMEDIATE / BEGIN DEFERRED for reads
  Memory: in-place writes under the exclusive lock, undone on rollback
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
