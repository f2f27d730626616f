#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/audit/audit_log.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/maintenance/job_handler.hpp"

namespace recall::maintenance {

struct CleanupPolicy {
  uint32_t unused_days          = 180;
  double   low_importance_below = 0.3;
};

// "expired", "unused" or nullopt when the record stays active.
std::optional<std::string> CleanupReason(const db::model::MemoryRecord& record, uint64_t now_ms, const CleanupPolicy& policy);

// Archives expired and long-unused low-importance records, one DELETE audit entry each.
class CleanupJob final : public JobHandler {
 public:
  CleanupJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<audit::AuditLog> audit, CleanupPolicy policy);

  recall::memory::v1::JobType Type() const override {
    return recall::memory::v1::JOB_TYPE_CLEANUP;
  }

  std::string Run(const JobContext& context) override;

 private:
  std::shared_ptr<core::MemoryStore> store_;
  std::shared_ptr<audit::AuditLog>   audit_;
  CleanupPolicy                      policy_;
};

} // namespace recall::maintenance
