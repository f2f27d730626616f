#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace recall::audit {

/*
  Append-only log of every decision the engine takes.

  Record() never throws into the write path: a failed append is logged at
  error level and reported through the return value.
*/
class AuditLog {
 public:
  explicit AuditLog(std::shared_ptr<db::Repository> repository);

  // Fills id and created_at when unset.
  bool Record(db::model::MemoryOperationRecord entry);

  // Newest first; limit 0 = all.
  std::vector<db::model::MemoryOperationRecord> ForOwner(const std::string& owner_id, uint64_t limit = 0);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace recall::audit
