#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/collaborator/collaborator_client.hpp"
#include "internal/db/model/category_summary_record.hpp"

namespace recall::retrieval {

/*
  Decides whether category summaries alone answer a query, so that retrieval
  can skip the record tier.
*/
class SufficiencyJudge {
 public:
  virtual ~SufficiencyJudge() = default;

  virtual bool Sufficient(const std::string& query, const std::vector<db::model::CategorySummaryRecord>& summaries,
                          const std::vector<std::string>& known_entities) = 0;
};

// No when the query names a known entity (it wants specifics); yes when any
// relevant summary exists.
class HeuristicSufficiencyJudge final : public SufficiencyJudge {
 public:
  bool Sufficient(const std::string& query, const std::vector<db::model::CategorySummaryRecord>& summaries,
                  const std::vector<std::string>& known_entities) override;
};

// Asks the collaborator; falls back to the heuristic on any failure.
class CollaboratorSufficiencyJudge final : public SufficiencyJudge {
 public:
  CollaboratorSufficiencyJudge(std::shared_ptr<collaborator::CollaboratorClient> client, collaborator::CallPolicy policy);

  bool Sufficient(const std::string& query, const std::vector<db::model::CategorySummaryRecord>& summaries,
                  const std::vector<std::string>& known_entities) override;

 private:
  std::shared_ptr<collaborator::CollaboratorClient> client_;
  collaborator::CallPolicy                          policy_;
  HeuristicSufficiencyJudge                         fallback_;
};

} // namespace recall::retrieval
