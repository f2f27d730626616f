#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_log.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/decision/decision_adapter.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/extraction/candidate.hpp"
#include "internal/retrieval/similarity_retriever.hpp"
#include "internal/util/cancellation.hpp"

namespace recall::core {

struct UpdatePolicy {
  std::size_t similar_k            = 10;
  double      similarity_threshold = 0.5;
  uint32_t    max_conflict_retries = 3;

  // Sentiment samples averaged into a record's sentiment_average.
  uint32_t sentiment_window = MemoryStore::kSentimentWindow;
};

struct ApplyOptions {
  std::string             source_id;
  std::string             job_id;
  util::CancellationToken cancel;
};

// What happened to one candidate; mirrors its audit entry.
struct CandidateOutcome {
  recall::memory::v1::Operation        operation = recall::memory::v1::OPERATION_NOOP;
  recall::memory::v1::MergeStrategy    strategy  = recall::memory::v1::MERGE_STRATEGY_UNSPECIFIED;
  recall::memory::v1::OperationOutcome outcome   = recall::memory::v1::OPERATION_OUTCOME_APPLIED;

  std::string              target_id;
  std::vector<std::string> result_ids;
  std::string              reasoning;
  std::string              error;
  std::string              audit_id;
};

/*
  UpdateEngine

  Per candidate: embed, find similar records, ask the decision collaborator,
  validate the decision deterministically, apply it through the store and
  append one audit entry.

  Apply() never throws. Collaborator outages, conflicts that outlast the
  retry budget and invariant violations end up as failed/rejected audit
  entries; a cancelled token yields `cancelled` entries without mutations.
*/
class UpdateEngine {
 public:
  UpdateEngine(std::shared_ptr<MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
               std::shared_ptr<retrieval::SimilarityRetriever> retriever, std::shared_ptr<decision::DecisionAdapter> decider,
               std::shared_ptr<audit::AuditLog> audit, UpdatePolicy policy);

  std::vector<CandidateOutcome> Apply(const std::string& owner_id, const std::vector<extraction::Candidate>& candidates,
                                      const ApplyOptions& options);

 private:
  struct Plan;
  struct Applied;

  // Throws DecisionUnavailable only when allow_requeue is set.
  CandidateOutcome Process(const std::string& owner_id, const extraction::Candidate& candidate, const ApplyOptions& options,
                           bool allow_requeue);

  Plan Resolve(const std::string& owner_id, const extraction::Candidate& candidate,
               const std::vector<retrieval::SimilarRecord>& similar, const decision::Decision& decision);

  void Execute(const std::string& owner_id, const extraction::Candidate& candidate, const std::vector<float>& embedding,
               Plan& plan, Applied& applied);

  // Re-reads the contested slot or chain head after a conflict and rewrites plan.
  void Reconcile(const std::string& owner_id, const extraction::Candidate& candidate, const std::string& occupant_id,
                 Plan& plan);

  db::model::MemoryRecord NewRecord(const std::string& owner_id, const extraction::Candidate& candidate,
                                    const std::vector<float>& embedding) const;

  std::shared_ptr<MemoryStore>                    store_;
  std::shared_ptr<embedding::EmbeddingAdapter>    embedder_;
  std::shared_ptr<retrieval::SimilarityRetriever> retriever_;
  std::shared_ptr<decision::DecisionAdapter>      decider_;
  std::shared_ptr<audit::AuditLog>                audit_;
  UpdatePolicy                                    policy_;
};

} // namespace recall::core
