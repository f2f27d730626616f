#include "internal/core/memory_engine.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::testing::DecisionJson;
using recall::testing::Fact;
using recall::testing::TestStack;

namespace {

const std::string kOwner = "user-1";

std::string Extraction(const std::vector<CandidateFact>& facts) {
  ExtractionResponse response;
  for (const auto& fact : facts) *response.add_candidates() = fact;
  return util::ToJson(response);
}

void TestObserveExtractsAndApplies() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_ENTITY, "Marcus", "is a coworker", "", 0.9);

  ExtractionRequest seen;
  stack.collaborator->On(collaborator::kExtractFactsTool, [&](const std::string& json) {
    util::FromJson(json, &seen, true);
    return Extraction({Fact("preference", "Marcus", "likes espresso"), Fact("fact", "", "missing subject")});
  });
  stack.collaborator->On(collaborator::kDecideUpdateTool, [](const std::string&) { return DecisionJson("ADD"); });

  core::ApplyOptions options;
  options.source_id = "note-42";
  auto report = stack.engine->Observe(kOwner, "Marcus said he likes espresso.", options);

  assert(seen.text() == "Marcus said he likes espresso.");
  assert(seen.known_entities_size() == 1 && seen.known_entities(0) == "Marcus");

  assert(report.candidates_extracted == 1);
  assert(report.outcomes.size() == 1);
  assert(report.outcomes[0].operation == OPERATION_ADD);
  assert(report.outcomes[0].outcome == OPERATION_OUTCOME_APPLIED);
  assert(stack.store->ListActive(kOwner).size() == 2);

  auto history = stack.engine->History(kOwner);
  assert(history.size() == 1);
  assert(history[0].source_id == "note-42");
}

void TestObserveSurvivesExtractionOutage() {
  TestStack stack;
  stack.collaborator->On(collaborator::kExtractFactsTool, [](const std::string&) -> std::string {
    throw std::runtime_error("model overloaded");
  });

  auto report = stack.engine->Observe(kOwner, "Anna moved to Bergen.");
  assert(report.candidates_extracted == 0);
  assert(report.outcomes.empty());
  assert(stack.store->ListActive(kOwner).empty());

  // Blank input never reaches the collaborator.
  const auto calls = stack.collaborator->Calls();
  stack.engine->Observe(kOwner, "   ");
  assert(stack.collaborator->Calls() == calls);
}

void TestOperatorDelete() {
  TestStack stack;
  auto soft = stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "drives a red car");
  auto hard = stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "has a cat named Miso");

  bool refused = false;
  try {
    stack.engine->Delete("someone-else", soft.id, false);
  } catch (const util::NotFound&) {
    refused = true;
  }
  assert(refused);
  assert(stack.store->GetById(soft.id)->status == RECORD_STATUS_ACTIVE);

  auto archived = stack.engine->Delete(kOwner, soft.id, false);
  assert(archived.status == RECORD_STATUS_ARCHIVED);
  assert(stack.store->GetById(soft.id));

  stack.engine->Delete(kOwner, hard.id, true);
  assert(!stack.store->GetById(hard.id));

  auto history = stack.engine->History(kOwner);
  assert(history.size() == 2);
  std::size_t snapshots = 0;
  for (const auto& entry : history) {
    assert(entry.operation == OPERATION_DELETE);
    if (!entry.snapshot_json.empty()) {
      ++snapshots;
      assert(entry.reasoning == "operator hard delete");
      assert(entry.snapshot_json.find("Miso") != std::string::npos);
    }
  }
  assert(snapshots == 1);
  assert(stack.engine->History(kOwner, 1).size() == 1);
}

void TestKnownEntitiesRankedAndDeduplicated() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "anna", "likes tea", "", 0.2);
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo", "", 0.7);
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Marcus", "works at Meta", "", 0.9);
  stack.Seed("user-2", MEMORY_KIND_FACT, "Zoe", "plays drums");

  auto names = stack.engine->KnownEntities(kOwner);
  assert(names.size() == 2);
  assert(names[0] == "Marcus");
  assert(names[1] == "Anna");
}

void TestEnqueueJob() {
  TestStack stack;
  auto id  = stack.engine->EnqueueJob(JOB_TYPE_DECAY, kOwner);
  auto job = stack.queue->Get(id);
  assert(job);
  assert(job->job_type == JOB_TYPE_DECAY);
  assert(job->status == JOB_STATUS_PENDING);
  assert(job->owner_id == kOwner);
}

} // namespace

int main() {
  TestObserveExtractsAndApplies();
  TestObserveSurvivesExtractionOutage();
  TestOperatorDelete();
  TestKnownEntitiesRankedAndDeduplicated();
  TestEnqueueJob();
  std::cout << "memory_engine_test: pass" << std::endl;
  return 0;
}
