#include "internal/decision/decision_adapter.hpp"

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace recall::decision {

using namespace recall::memory::v1;

DecisionAdapter::DecisionAdapter(std::shared_ptr<collaborator::CollaboratorClient> client, collaborator::CallPolicy policy)
    : client_(std::move(client)), policy_(policy) {
}

Decision DecisionAdapter::Parse(const DecisionResponse& response) {
  Decision d;

  const auto op = util::NormalizeKey(response.operation());
  if (op == "add") {
    d.operation = OPERATION_ADD;
  } else if (op == "update") {
    d.operation = OPERATION_UPDATE;
  } else if (op == "delete") {
    d.operation = OPERATION_DELETE;
  } else if (op == "noop" || op == "none") {
    d.operation = OPERATION_NOOP;
  } else {
    throw util::DecisionUnavailable("unusable decision operation '" + response.operation() + "'");
  }

  const auto strategy = util::NormalizeKey(response.merge_strategy());
  if (strategy == "replace") {
    d.strategy = MERGE_STRATEGY_REPLACE;
  } else if (strategy == "append") {
    d.strategy = MERGE_STRATEGY_APPEND;
  } else if (strategy == "supersede") {
    d.strategy = MERGE_STRATEGY_SUPERSEDE;
  }

  d.target_id   = util::Trim(response.target_id());
  d.reasoning   = response.reasoning();
  d.same_entity = response.same_entity();
  return d;
}

Decision DecisionAdapter::Decide(const CandidateFact& candidate, const std::vector<MemoryRecordView>& similar) {
  observability::SpanScope span("recall.decide");
  span.SetAttribute("similar", static_cast<std::int64_t>(similar.size()));

  DecisionRequest request;
  *request.mutable_candidate() = candidate;
  for (const auto& view : similar) *request.add_similar() = view;

  DecisionResponse response;
  try {
    collaborator::Invoke(client_, collaborator::kDecideUpdateTool, request, &response, policy_);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::DecisionUnavailable(e.what());
  }
  return Parse(response);
}

} // namespace recall::decision
