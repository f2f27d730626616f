#pragma once

#include <memory>

#include "internal/audit/audit_log.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/maintenance/job_handler.hpp"

namespace recall::maintenance {

// Keeper of a near-duplicate pair: higher importance, then more accesses, then older.
const db::model::MemoryRecord& PickKeeper(const db::model::MemoryRecord& a, const db::model::MemoryRecord& b);

// Keeper content plus the other's content when it says something new. Never invents text.
std::string MergeContent(const std::string& keeper_content, const std::string& other_content);

/*
  Folds near-duplicate active records of one owner into a single record.

  A pair qualifies when cosine >= threshold, the subjects match (directly or
  through aliases), predicates do not disagree and sensitivities are equal.
  The other record is archived with superseded_by = keeper and a CONSOLIDATE
  audit entry is written per merge.
*/
class ConsolidateJob final : public JobHandler {
 public:
  ConsolidateJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
                 std::shared_ptr<audit::AuditLog> audit, double similarity_threshold);

  recall::memory::v1::JobType Type() const override {
    return recall::memory::v1::JOB_TYPE_CONSOLIDATE;
  }

  std::string Run(const JobContext& context) override;

 private:
  std::shared_ptr<core::MemoryStore>           store_;
  std::shared_ptr<embedding::EmbeddingAdapter> embedder_;
  std::shared_ptr<audit::AuditLog>             audit_;
  double                                       threshold_;
};

} // namespace recall::maintenance
