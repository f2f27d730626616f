#include "internal/retrieval/sufficiency_judge.hpp"

#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace recall::retrieval {

bool HeuristicSufficiencyJudge::Sufficient(const std::string& query,
                                           const std::vector<db::model::CategorySummaryRecord>& summaries,
                                           const std::vector<std::string>& known_entities) {
  if (summaries.empty()) return false;

  const auto padded = " " + util::NormalizeText(query) + " ";
  for (const auto& entity : known_entities) {
    const auto name = util::NormalizeText(entity);
    if (!name.empty() && padded.find(" " + name + " ") != std::string::npos) return false;
  }
  return true;
}

CollaboratorSufficiencyJudge::CollaboratorSufficiencyJudge(std::shared_ptr<collaborator::CollaboratorClient> client,
                                                           collaborator::CallPolicy policy)
    : client_(std::move(client)), policy_(policy) {
}

bool CollaboratorSufficiencyJudge::Sufficient(const std::string& query,
                                              const std::vector<db::model::CategorySummaryRecord>& summaries,
                                              const std::vector<std::string>& known_entities) {
  if (summaries.empty()) return false;

  recall::memory::v1::SufficiencyRequest request;
  request.set_query(query);
  for (const auto& summary : summaries) *request.add_summaries() = core::ToView(summary);

  recall::memory::v1::SufficiencyResponse response;
  try {
    collaborator::Invoke(client_, collaborator::kJudgeSufficiencyTool, request, &response, policy_);
    return response.sufficient();
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("sufficiency judge unavailable; using heuristic", {observability::StringField("error", e.what())});
    return fallback_.Sufficient(query, summaries, known_entities);
  }
}

} // namespace recall::retrieval
