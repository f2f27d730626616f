#include "memory_tx.hpp"

namespace recall::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    rolled_back_ = true;
    working_.reset();
    throw CommitConflict("memory transaction conflict: another transaction committed first");
  }
  repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace recall::db::memory
