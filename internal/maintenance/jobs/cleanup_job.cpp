#include "internal/maintenance/jobs/cleanup_job.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace recall::maintenance {

using namespace recall::memory::v1;

std::optional<std::string> CleanupReason(const db::model::MemoryRecord& record, uint64_t now_ms, const CleanupPolicy& policy) {
  if (record.status != RECORD_STATUS_ACTIVE) return std::nullopt;
  if (record.expires_at_ms != 0 && record.expires_at_ms <= now_ms) return std::string("expired");

  if (record.user_pinned || record.importance >= policy.low_importance_below) return std::nullopt;
  const uint64_t last_used = record.last_accessed_at_ms != 0 ? record.last_accessed_at_ms : record.created_at_ms;
  if (last_used == 0 || last_used >= now_ms) return std::nullopt;
  if (now_ms - last_used > static_cast<uint64_t>(policy.unused_days) * util::kMillisPerDay) return std::string("unused");
  return std::nullopt;
}

CleanupJob::CleanupJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<audit::AuditLog> audit, CleanupPolicy policy)
    : store_(std::move(store)), audit_(std::move(audit)), policy_(policy) {
}

std::string CleanupJob::Run(const JobContext& context) {
  std::size_t expired = 0;
  std::size_t unused  = 0;
  std::size_t skipped = 0;

  for (const auto& record : store_->ListActive(context.job.owner_id)) {
    auto reason = CleanupReason(record, context.now_ms, policy_);
    if (!reason) continue;

    try {
      store_->SoftDelete(record.id, record.revision);
    } catch (const util::SlotConflict&) {
      ++skipped;
      continue;
    } catch (const util::NotFound&) {
      ++skipped;
      continue;
    }

    db::model::MemoryOperationRecord entry;
    entry.owner_id    = record.owner_id;
    entry.operation   = OPERATION_DELETE;
    entry.outcome     = OPERATION_OUTCOME_APPLIED;
    entry.target_id   = record.id;
    entry.result_ids  = {record.id};
    entry.reasoning   = *reason;
    entry.old_content = record.content;
    entry.job_id      = context.job.id;
    audit_->Record(std::move(entry));

    (*reason == "expired" ? expired : unused) += 1;
  }

  RECALL_LOG_DEBUG("cleanup pass", {observability::StringField("owner_id", context.job.owner_id),
                                    observability::IntField("expired", static_cast<std::int64_t>(expired)),
                                    observability::IntField("unused", static_cast<std::int64_t>(unused))});
  return "expired=" + std::to_string(expired) + " unused=" + std::to_string(unused) + " skipped=" + std::to_string(skipped);
}

} // namespace recall::maintenance
