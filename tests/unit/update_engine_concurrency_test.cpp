#include "internal/core/update_engine.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::testing::Axis;
using recall::testing::DecisionJson;
using recall::testing::Fact;
using recall::testing::Near0;
using recall::testing::TestStack;

namespace {

const std::string kOwner = "user-1";

// Holds every caller until `parties` have arrived or the wait times out.
class Rendezvous {
 public:
  explicit Rendezvous(int parties) : parties_(parties) {
  }

  void Arrive() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++arrived_;
    cv_.notify_all();
    cv_.wait_for(lock, std::chrono::milliseconds(500), [this] { return arrived_ >= parties_; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     parties_;
  int                     arrived_ = 0;
};

std::size_t ActiveSlotHolders(TestStack& stack, const std::string& subject, const std::string& predicate) {
  std::size_t n = 0;
  for (const auto& r : stack.store->ListActive(kOwner)) {
    if (r.subject_name == subject && r.predicate == predicate) ++n;
  }
  return n;
}

// Both writers decided against the same version; the loser reconciles against the new head.
void TestConcurrentSupersedesOfOneSlot() {
  TestStack stack;
  stack.provider->Set("Marcus: works at Google", Axis(0));
  stack.provider->Set("Marcus: works at Meta", Near0(0.9, 1));
  stack.provider->Set("Marcus: works at Apple", Near0(0.9, 2));
  auto google = stack.Seed(kOwner, MEMORY_KIND_FACT, "Marcus", "works at Google", "employer");

  Rendezvous both(2);
  stack.collaborator->On(collaborator::kDecideUpdateTool, [&](const std::string&) {
    both.Arrive();
    return DecisionJson("UPDATE", "supersede", google.id);
  });

  std::vector<core::ObservationReport> reports(2);
  std::thread meta([&] { reports[0] = stack.engine->ObserveCandidates(kOwner, {Fact("fact", "Marcus", "works at Meta", "employer")}); });
  std::thread apple([&] { reports[1] = stack.engine->ObserveCandidates(kOwner, {Fact("fact", "Marcus", "works at Apple", "employer")}); });
  meta.join();
  apple.join();

  for (const auto& report : reports) {
    assert(report.outcomes.size() == 1);
    assert(report.outcomes[0].outcome == OPERATION_OUTCOME_APPLIED);
  }

  assert(ActiveSlotHolders(stack, "Marcus", "employer") == 1);
  auto head = stack.store->GetActiveBySlot(kOwner, "Marcus", "employer");
  assert(head);

  // Nothing was lost: the chain runs from Google through both later employers.
  auto chain = stack.store->VersionChain(head->id);
  assert(chain.size() == 3);
  assert(chain.front().id == google.id);
  assert(head->version == 3);
  assert(stack.engine->History(kOwner).size() == 2);
}

// Two adds racing into an empty slot leave one holder; the second writer supersedes it.
void TestConcurrentAddsIntoEmptySlot() {
  TestStack stack;
  stack.provider->Set("Anna: lives in Oslo", Axis(0));
  stack.provider->Set("Anna: lives in Bergen", Axis(1));

  Rendezvous both(2);
  stack.collaborator->On(collaborator::kDecideUpdateTool, [&](const std::string&) {
    both.Arrive();
    return DecisionJson("ADD");
  });

  std::vector<core::ObservationReport> reports(2);
  std::thread oslo([&] { reports[0] = stack.engine->ObserveCandidates(kOwner, {Fact("fact", "Anna", "lives in Oslo", "city")}); });
  std::thread bergen([&] { reports[1] = stack.engine->ObserveCandidates(kOwner, {Fact("fact", "Anna", "lives in Bergen", "city")}); });
  oslo.join();
  bergen.join();

  std::size_t adds = 0, supersedes = 0;
  for (const auto& report : reports) {
    assert(report.outcomes[0].outcome == OPERATION_OUTCOME_APPLIED);
    if (report.outcomes[0].operation == OPERATION_ADD) ++adds;
    if (report.outcomes[0].strategy == MERGE_STRATEGY_SUPERSEDE) ++supersedes;
  }
  assert(adds == 1);
  assert(supersedes == 1);
  assert(ActiveSlotHolders(stack, "Anna", "city") == 1);
}

// Many writers appending to one record serialize on its revision; every fact survives.
void TestConcurrentAppendsKeepEveryFact() {
  TestStack stack;
  auto hobbies = stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "enjoys hiking");
  stack.collaborator->On(collaborator::kDecideUpdateTool,
                         [&](const std::string&) { return DecisionJson("UPDATE", "append", hobbies.id); });

  const std::vector<std::string> facts = {"plays chess", "paints watercolors", "grows tomatoes"};
  std::vector<std::thread>       writers;
  std::vector<core::ObservationReport> reports(facts.size());
  for (std::size_t i = 0; i < facts.size(); ++i) {
    writers.emplace_back([&, i] { reports[i] = stack.engine->ObserveCandidates(kOwner, {Fact("fact", "Anna", facts[i])}); });
  }
  for (auto& t : writers) t.join();

  // Every applied fact is stored somewhere; a lost update would drop one.
  const auto active = stack.store->ListActive(kOwner);
  auto       stored = [&](const std::string& text) {
    for (const auto& r : active) {
      if (r.content.find(text) != std::string::npos) return true;
    }
    return false;
  };
  for (std::size_t i = 0; i < facts.size(); ++i) {
    if (reports[i].outcomes[0].outcome == OPERATION_OUTCOME_APPLIED) assert(stored(facts[i]));
  }
  assert(stored("enjoys hiking"));
}

} // namespace

int main() {
  TestConcurrentSupersedesOfOneSlot();
  TestConcurrentAddsIntoEmptySlot();
  TestConcurrentAppendsKeepEveryFact();
  std::cout << "update_engine_concurrency_test: pass" << std::endl;
  return 0;
}
