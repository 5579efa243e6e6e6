#include "memory_tx.hpp"

namespace berth::storage::memory {

MemoryTransaction::MemoryTransaction(MemoryStore& store) : store_(store), lock_(store_.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  Release();
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    return;
  }
  if (working_) {
    store_.committed_ = std::move(*working_);
  }
  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  Release();
}

void MemoryTransaction::Release() {
  working_.reset();
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace berth::storage::memory
