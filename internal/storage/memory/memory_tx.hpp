#pragma once

#include <mutex>
#include <optional>

#include "internal/storage/api/transaction.hpp"
#include "memory_store.hpp"

namespace berth::storage::memory {

/*
  Transaction = store lock + lazy write set

  The store lock is held from construction until Commit() or Rollback(),
  so reads see the committed state directly and the first write takes
  the only copy.
*/

class MemoryTransaction final : public storage::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore& store);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryStore::State& Mutable() {
    if (!working_) {
      working_ = store_.committed_;
    }
    return *working_;
  }
  const MemoryStore::State& View() const {
    return working_ ? *working_ : store_.committed_;
  }

 private:
  void Release();

  MemoryStore&                      store_;
  std::unique_lock<std::mutex>      lock_;
  std::optional<MemoryStore::State> working_;
  bool                              committed_ = false;
};

} // namespace berth::storage::memory
