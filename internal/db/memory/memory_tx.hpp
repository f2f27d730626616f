#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace recall::db::memory {

/*
  Snapshot transaction over MemoryRepository.

  Begin pins the committed state by reference. Reads go to the pinned
  snapshot until the first Mutable() call copies it into a private working
  state. Commit publishes the working state if nobody else committed since
  the snapshot was taken, otherwise it throws CommitConflict. Read-only
  transactions never copy and never conflict.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace recall::db::memory
