#pragma once

#include <cstdint>
#include <functional>

#include "internal/db/api/repository.hpp"

namespace recall::db {

/*
  Runs fn inside a fresh transaction and commits it. When an optimistic
  backend reports CommitConflict the whole body is rerun against a new
  snapshot, up to max_attempts times; the last CommitConflict propagates.

  fn must be safe to rerun: it reads what it needs through the transaction
  it is given and assigns (not accumulates) any captured outputs.
*/
inline void RunWithCommitRetry(Repository& repository, uint32_t max_attempts, const std::function<void(Transaction&)>& fn) {
  for (uint32_t attempt = 1;; ++attempt) {
    auto tx = repository.Begin();
    fn(*tx);
    try {
      tx->Commit();
      return;
    } catch (const CommitConflict&) {
      if (attempt >= max_attempts) throw;
    }
  }
}

} // namespace recall::db
