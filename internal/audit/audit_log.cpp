#include "internal/audit/audit_log.hpp"

#include <stdexcept>

#include "internal/core/record_codec.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recall::audit {

namespace {
constexpr uint32_t kAppendAttempts = 5;
}

AuditLog::AuditLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("AuditLog: repository is required");
  }
}

bool AuditLog::Record(db::model::MemoryOperationRecord entry) {
  if (entry.id.empty()) entry.id = util::NewId();
  if (entry.created_at_ms == 0) entry.created_at_ms = util::ToUnixMillis(util::Now());

  try {
    db::RunWithCommitRetry(*repository_, kAppendAttempts, [&](db::Transaction& tx) {
      auto result = repository_->AppendOperation(tx, entry);
      if (!result) throw std::runtime_error(result.Describe("append operation"));
    });
    return true;
  } catch (const std::exception& e) {
    RECALL_LOG_ERROR("audit append failed", {observability::StringField("owner_id", entry.owner_id),
                                             observability::StringField("operation", core::OperationName(entry.operation)),
                                             observability::StringField("target_id", entry.target_id),
                                             observability::StringField("error", e.what())});
    return false;
  }
}

std::vector<db::model::MemoryOperationRecord> AuditLog::ForOwner(const std::string& owner_id, uint64_t limit) {
  auto tx = repository_->Begin();
  return repository_->ListOperations(*tx, owner_id, limit);
}

} // namespace recall::audit
