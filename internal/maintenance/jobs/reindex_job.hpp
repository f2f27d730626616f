#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_store.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/maintenance/job_handler.hpp"

namespace recall::maintenance {

// Co-access strengths from the access log: co / sqrt(n_a * n_b) per pair seen in one batch.
std::vector<db::model::RelationshipRecord> ComputeRelationships(const std::string& owner_id,
                                                                const std::vector<db::model::AccessRecord>& accesses,
                                                                uint64_t now_ms);

/*
  Re-embeds active records produced by another model (or all of them with
  payload {"force": true}) and recomputes relationship strengths.
  An unreachable embedding collaborator fails the job so it is retried.
*/
class ReindexJob final : public JobHandler {
 public:
  ReindexJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder);

  recall::memory::v1::JobType Type() const override {
    return recall::memory::v1::JOB_TYPE_REINDEX;
  }

  std::string Run(const JobContext& context) override;

 private:
  std::shared_ptr<core::MemoryStore>           store_;
  std::shared_ptr<embedding::EmbeddingAdapter> embedder_;
};

} // namespace recall::maintenance
