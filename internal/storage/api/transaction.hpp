#pragma once

namespace berth::storage {

/*
  Abstract transaction.

  Semantics guaranteed for all backends:

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if not committed
  - Transactions on one store are serialised: Begin() blocks while
    another transaction is open, so concurrent callers never see a
    conflict. Never open two on the same thread.

  SQLite: connection lock + BEGIN IMMEDIATE
  Memory: store lock + copy on first write
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace berth::storage
