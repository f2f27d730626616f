#include "internal/decision/decision_adapter.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/util/errors.hpp"
#include "support/scripted_collaborator.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::testing::DecisionJson;
using recall::testing::Fact;
using recall::testing::ScriptedCollaborator;

namespace {

collaborator::CallPolicy FastPolicy(uint32_t retries = 0) {
  collaborator::CallPolicy policy;
  policy.timeout     = std::chrono::milliseconds(200);
  policy.max_retries = retries;
  return policy;
}

void TestParseOperationsAndStrategies() {
  DecisionResponse response;
  response.set_operation("Update");
  response.set_merge_strategy("SUPERSEDE");
  response.set_target_id(" m-1 ");
  response.set_same_entity(true);

  auto d = decision::DecisionAdapter::Parse(response);
  assert(d.operation == OPERATION_UPDATE);
  assert(d.strategy == MERGE_STRATEGY_SUPERSEDE);
  assert(d.target_id == "m-1");
  assert(d.same_entity);

  response.set_operation("none");
  response.set_merge_strategy("blend");
  d = decision::DecisionAdapter::Parse(response);
  assert(d.operation == OPERATION_NOOP);
  assert(d.strategy == MERGE_STRATEGY_UNSPECIFIED);

  response.set_operation("merge");
  bool unusable = false;
  try {
    decision::DecisionAdapter::Parse(response);
  } catch (const util::DecisionUnavailable&) {
    unusable = true;
  }
  assert(unusable);
}

void TestDecideSendsCandidateAndSimilar() {
  auto client = std::make_shared<ScriptedCollaborator>();
  client->On(collaborator::kDecideUpdateTool, [](const std::string& json) {
    auto request = recall::testing::ParseDecisionRequest(json);
    assert(request.candidate().subject_name() == "Marcus");
    assert(request.similar_size() == 1);
    return DecisionJson("UPDATE", "replace", request.similar(0).id());
  });

  MemoryRecordView view;
  view.set_id("m-7");
  view.set_subject_name("Marcus");

  decision::DecisionAdapter adapter(client, FastPolicy());
  auto d = adapter.Decide(Fact("fact", "Marcus", "works at Meta", "employer"), {view});
  assert(d.operation == OPERATION_UPDATE);
  assert(d.strategy == MERGE_STRATEGY_REPLACE);
  assert(d.target_id == "m-7");
}

void TestFailuresBecomeDecisionUnavailable() {
  auto client = std::make_shared<ScriptedCollaborator>();
  client->On(collaborator::kDecideUpdateTool, [](const std::string&) -> std::string { throw std::runtime_error("overloaded"); });

  decision::DecisionAdapter adapter(client, FastPolicy(2));
  bool unavailable = false;
  try {
    adapter.Decide(Fact("fact", "Marcus", "works at Meta"), {});
  } catch (const util::DecisionUnavailable&) {
    unavailable = true;
  }
  assert(unavailable);
  assert(client->CallsTo(collaborator::kDecideUpdateTool) == 3);
}

void TestTimeoutBecomesDecisionUnavailable() {
  auto client = std::make_shared<ScriptedCollaborator>();
  client->On(collaborator::kDecideUpdateTool, [](const std::string&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    return DecisionJson("ADD");
  });

  decision::DecisionAdapter adapter(client, FastPolicy());
  const auto started     = std::chrono::steady_clock::now();
  bool       unavailable = false;
  try {
    adapter.Decide(Fact("fact", "Marcus", "works at Meta"), {});
  } catch (const util::DecisionUnavailable&) {
    unavailable = true;
  }
  assert(unavailable);
  assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(550));
  // Let the abandoned call finish before the collaborator goes away.
  std::this_thread::sleep_for(std::chrono::milliseconds(700));
}

} // namespace

int main() {
  TestParseOperationsAndStrategies();
  TestDecideSendsCandidateAndSimilar();
  TestFailuresBecomeDecisionUnavailable();
  TestTimeoutBecomesDecisionUnavailable();
  std::cout << "decision_adapter_test: pass" << std::endl;
  return 0;
}
