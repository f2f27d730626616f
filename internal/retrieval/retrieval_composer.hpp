#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_store.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/retrieval/similarity_retriever.hpp"
#include "internal/retrieval/sufficiency_judge.hpp"

namespace recall::retrieval {

struct RetrievalPolicy {
  uint32_t    default_token_budget   = 2000;
  std::size_t candidate_pool         = 50;
  double      min_similarity         = 0.3;
  double      min_value_per_token    = 0.002;
  double      recency_half_life_days = 14.0;
  std::size_t max_summary_categories = 3;
};

struct ScoredRecord {
  db::model::MemoryRecord record;
  double                  similarity = 0.0;
  double                  score      = 0.0;
  std::size_t             tokens     = 0;
};

struct RetrievalResult {
  std::vector<db::model::CategorySummaryRecord> summaries;
  std::vector<ScoredRecord>                     records;
  bool                                          from_summaries = false;
  std::size_t                                   tokens_used    = 0;
  std::string                                   batch_id;
};

/*
  RetrievalComposer

  Tier 1: summaries of the categories the query touches, if the judge says
  they suffice. Tier 2: similar records, scored

      0.5 * similarity + 0.2 * importance + 0.15 * recency + 0.15 * frequency

  and packed greedily into the token budget until value per token drops
  below the configured minimum. Private records only with include_private.
  Read-only apart from best-effort access bookkeeping.
*/
class RetrievalComposer {
 public:
  RetrievalComposer(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
                    std::shared_ptr<SimilarityRetriever> retriever, std::shared_ptr<SufficiencyJudge> judge,
                    RetrievalPolicy policy);

  // token_budget 0 = policy default.
  RetrievalResult Retrieve(const std::string& owner_id, const std::string& query, uint32_t token_budget = 0,
                           bool include_private = false);

  // Exposed for tests.
  static double Score(double similarity, const db::model::MemoryRecord& record, uint64_t now_ms, double half_life_days);

 private:
  std::vector<std::string> KnownEntities(const std::string& owner_id);

  std::shared_ptr<core::MemoryStore>           store_;
  std::shared_ptr<embedding::EmbeddingAdapter> embedder_;
  std::shared_ptr<SimilarityRetriever>         retriever_;
  std::shared_ptr<SufficiencyJudge>            judge_;
  RetrievalPolicy                              policy_;
};

} // namespace recall::retrieval
