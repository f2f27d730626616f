#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/collaborator/collaborator_client.hpp"
#include "recall/memory/v1.hpp"

namespace recall::decision {

struct Decision {
  recall::memory::v1::Operation     operation = recall::memory::v1::OPERATION_NOOP;
  recall::memory::v1::MergeStrategy strategy  = recall::memory::v1::MERGE_STRATEGY_UNSPECIFIED;
  std::string                       target_id;
  std::string                       reasoning;
  bool                              same_entity = false;
};

/*
  DecisionAdapter

  {candidate, similar[]} -> Decision via the decision collaborator.

  The reply is only parsed here; deterministic validation of the decision
  belongs to the update engine. Any failure, including an unusable
  operation, surfaces as DecisionUnavailable.
*/
class DecisionAdapter {
 public:
  DecisionAdapter(std::shared_ptr<collaborator::CollaboratorClient> client, collaborator::CallPolicy policy);

  Decision Decide(const recall::memory::v1::CandidateFact&                candidate,
                  const std::vector<recall::memory::v1::MemoryRecordView>& similar);

  static Decision Parse(const recall::memory::v1::DecisionResponse& response);

 private:
  std::shared_ptr<collaborator::CollaboratorClient> client_;
  collaborator::CallPolicy                          policy_;
};

} // namespace recall::decision
