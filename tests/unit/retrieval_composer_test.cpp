#include "internal/retrieval/retrieval_composer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/maintenance/jobs/cleanup_job.hpp"
#include "internal/maintenance/jobs/resummarize_job.hpp"
#include "internal/util/time.hpp"
#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::testing::Axis;
using recall::testing::Near0;
using recall::testing::NowMs;
using recall::testing::TestStack;

namespace {

const std::string kOwner = "user-1";

bool Contains(const retrieval::RetrievalResult& result, const std::string& id) {
  for (const auto& s : result.records) {
    if (s.record.id == id) return true;
  }
  return false;
}

void TestScoreFormula() {
  const auto now = NowMs();

  db::model::MemoryRecord r;
  r.importance    = 0.6;
  r.access_count  = 5;
  r.updated_at_ms = now - 14 * util::kMillisPerDay;

  // 0.5*0.8 + 0.2*0.6 + 0.15*0.5 + 0.15*0.5
  const double score = retrieval::RetrievalComposer::Score(0.8, r, now, 14.0);
  assert(std::fabs(score - 0.67) < 1e-9);

  // Frequency saturates at ten accesses.
  r.access_count  = 40;
  r.updated_at_ms = now;
  assert(std::fabs(retrieval::RetrievalComposer::Score(1.0, r, now, 14.0) - 0.92) < 1e-9);
}

void TestExpiredRecordLeavesAfterCleanup() {
  TestStack stack;
  stack.provider->Set("where does anna live", Axis(0));
  stack.provider->Set("Anna: lives in Oslo", Axis(0));
  auto home = stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo", "city");

  core::RecordPatch patch;
  patch.expires_at_ms = NowMs() - 1000;
  stack.store->Update(home.id, patch);

  // Reads may still see it until maintenance runs.
  assert(Contains(stack.composer->Retrieve(kOwner, "where does anna live"), home.id));

  maintenance::CleanupJob cleanup(stack.store, stack.audit, maintenance::CleanupPolicy{});
  db::model::MaintenanceJobRecord job;
  job.id       = "job-1";
  job.owner_id = kOwner;
  assert(cleanup.Run({job, NowMs()}) == "expired=1 unused=0 skipped=0");

  assert(!Contains(stack.composer->Retrieve(kOwner, "where does anna live"), home.id));
  auto row = stack.store->GetById(home.id);
  assert(row && row->status == RECORD_STATUS_ARCHIVED);

  auto history = stack.engine->History(kOwner);
  assert(history.size() == 1);
  assert(history[0].reasoning == "expired");
  assert(history[0].job_id == "job-1");
}

void TestPrivateRecordsNeedOptIn() {
  TestStack stack;
  stack.provider->Set("anna health", Axis(0));
  stack.provider->Set("Anna: sees a therapist weekly", Axis(0));
  auto therapy = stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "sees a therapist weekly");

  core::RecordPatch patch;
  patch.sensitivity = SENSITIVITY_PRIVATE;
  stack.store->Update(therapy.id, patch);

  assert(!Contains(stack.composer->Retrieve(kOwner, "anna health"), therapy.id));
  assert(Contains(stack.composer->Retrieve(kOwner, "anna health", 0, true), therapy.id));
}

void TestFutureRecordsAreNotYetVisible() {
  TestStack stack;
  stack.provider->Set("anna plans", Axis(0));
  stack.provider->Set("Anna: starts at the new office", Axis(0));
  auto plan = stack.Seed(kOwner, MEMORY_KIND_EVENT, "Anna", "starts at the new office");

  core::RecordPatch patch;
  patch.effective_from_ms = NowMs() + util::kMillisPerDay;
  stack.store->Update(plan.id, patch);

  assert(!Contains(stack.composer->Retrieve(kOwner, "anna plans"), plan.id));
}

void TestBudgetPacksBestFirst() {
  TestStack stack;
  stack.provider->Set("anna travel", Axis(0));
  stack.provider->Set("Anna: spent three weeks in Japan last spring", Axis(0));
  stack.provider->Set("Anna: took a long train ride across Norway", Near0(0.9, 1));
  stack.provider->Set("Anna: wants to see the northern lights soon", Near0(0.8, 2));
  auto japan  = stack.Seed(kOwner, MEMORY_KIND_EVENT, "Anna", "spent three weeks in Japan last spring");
  auto norway = stack.Seed(kOwner, MEMORY_KIND_EVENT, "Anna", "took a long train ride across Norway");
  stack.Seed(kOwner, MEMORY_KIND_GOAL, "Anna", "wants to see the northern lights soon");

  // Each record costs about twelve tokens.
  auto tight = stack.composer->Retrieve(kOwner, "anna travel", 15);
  assert(tight.records.size() == 1);
  assert(tight.records[0].record.id == japan.id);
  assert(tight.tokens_used <= 15);
  assert(!tight.batch_id.empty());

  auto roomy = stack.composer->Retrieve(kOwner, "anna travel", 1000);
  assert(roomy.records.size() == 3);
  assert(roomy.records[0].record.id == japan.id);
  assert(roomy.records[1].record.id == norway.id);
  for (std::size_t i = 1; i < roomy.records.size(); ++i) {
    assert(roomy.records[i - 1].score >= roomy.records[i].score);
  }

  // Returned records are counted as accessed.
  auto touched = stack.store->GetById(japan.id);
  assert(touched->access_count == 2);
  assert(touched->last_accessed_at_ms != 0);
}

void TestSummariesAnswerBroadQueries() {
  TestStack stack;
  stack.provider->Set("Marcus: manages the platform team", Axis(0));
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Marcus", "manages the platform team");

  db::model::CategorySummaryRecord summary;
  summary.owner_id     = kOwner;
  summary.category     = "work_life";
  summary.summary_text = "Marcus: manages the platform team.";
  summary.version      = 1;
  {
    auto tx = stack.repository->Begin();
    const auto stored = stack.repository->UpsertCategorySummary(*tx, summary);
    assert(stored);
    tx->Commit();
  }

  auto broad = stack.composer->Retrieve(kOwner, "how is work going");
  assert(broad.from_summaries);
  assert(broad.summaries.size() == 1);
  assert(broad.records.empty());
  assert(broad.tokens_used > 0);

  // A query naming a known entity goes to the records tier.
  stack.provider->Set("how is work going for marcus", Axis(0));
  auto specific = stack.composer->Retrieve(kOwner, "how is work going for marcus");
  assert(!specific.from_summaries);
  assert(specific.summaries.empty());
  assert(specific.records.size() == 1);
}

bool Mentions(const retrieval::RetrievalResult& result, const std::string& text) {
  for (const auto& s : result.summaries) {
    if (s.summary_text.find(text) != std::string::npos) return true;
  }
  for (const auto& s : result.records) {
    if (s.record.content.find(text) != std::string::npos) return true;
  }
  return false;
}

db::model::MemoryRecord SeedAt(TestStack& stack, const std::string& category, const std::string& subject,
                               const std::string& content) {
  auto              record = stack.Seed(kOwner, MEMORY_KIND_FACT, subject, content);
  core::RecordPatch patch;
  patch.category = category;
  return stack.store->Update(record.id, patch);
}

void Resummarize(TestStack& stack) {
  maintenance::ResummarizeJob     job(stack.store, std::make_shared<maintenance::ExtractiveSummaryWriter>(),
                                      maintenance::ResummarizePolicy{});
  db::model::MaintenanceJobRecord record;
  record.owner_id     = kOwner;
  record.payload_json = "{}";
  job.Run({record, NowMs()});
}

void TestDeletedMemberLeavesSummaries() {
  TestStack stack;
  auto affair = SeedAt(stack, "work_life", "Anna", "secret affair with her boss at work");
  SeedAt(stack, "work_life", "Marcus", "manages the platform team");
  Resummarize(stack);

  auto before = stack.composer->Retrieve(kOwner, "what happens at my job");
  assert(before.from_summaries);
  assert(Mentions(before, "secret affair"));

  stack.store->HardDelete(affair.id);

  auto after = stack.composer->Retrieve(kOwner, "what happens at my job");
  assert(!Mentions(after, "secret affair"));

  // The next pass rebuilds the summary from what is left.
  Resummarize(stack);
  auto rebuilt = stack.composer->Retrieve(kOwner, "what happens at my job");
  assert(rebuilt.from_summaries);
  assert(Mentions(rebuilt, "platform team"));
  assert(!Mentions(rebuilt, "secret affair"));
}

void TestArchivedAndPrivateMembersLeaveSummaries() {
  TestStack stack;
  auto affair = SeedAt(stack, "work_life", "Anna", "secret affair with her boss at work");
  auto team   = SeedAt(stack, "work_life", "Marcus", "manages the platform team");
  Resummarize(stack);
  stack.store->SoftDelete(affair.id);
  assert(!Mentions(stack.composer->Retrieve(kOwner, "what happens at my job"), "secret affair"));

  Resummarize(stack);
  assert(Mentions(stack.composer->Retrieve(kOwner, "what happens at my job"), "platform team"));
  core::RecordPatch patch;
  patch.sensitivity = SENSITIVITY_PRIVATE;
  stack.store->Update(team.id, patch);
  assert(!Mentions(stack.composer->Retrieve(kOwner, "what happens at my job"), "platform team"));
}

void TestSummaryWithInactiveMemberIsSkipped() {
  TestStack stack;
  auto team = stack.Seed(kOwner, MEMORY_KIND_FACT, "Marcus", "manages the platform team");

  db::model::CategorySummaryRecord summary;
  summary.owner_id          = kOwner;
  summary.category          = "work_life";
  summary.summary_text      = "Marcus: manages the platform team.";
  summary.member_record_ids = {team.id};
  summary.version           = 1;
  {
    auto tx = stack.repository->Begin();
    assert(stack.repository->UpsertCategorySummary(*tx, summary));
    tx->Commit();
  }
  assert(stack.composer->Retrieve(kOwner, "how is work going").from_summaries);

  // Archived behind the store's back: the summary is no longer served.
  {
    auto tx  = stack.repository->Begin();
    auto row = stack.repository->GetMemory(*tx, team.id);
    row->status = RECORD_STATUS_ARCHIVED;
    assert(stack.repository->UpdateMemory(*tx, *row));
    tx->Commit();
  }
  auto result = stack.composer->Retrieve(kOwner, "how is work going");
  assert(!result.from_summaries);
  assert(result.summaries.empty());
}

void TestEmbeddingOutageReturnsNothing() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  stack.provider->SetFailing(true);
  auto result = stack.composer->Retrieve(kOwner, "anna");
  assert(result.records.empty());
  assert(result.tokens_used == 0);
}

} // namespace

int main() {
  TestScoreFormula();
  TestExpiredRecordLeavesAfterCleanup();
  TestPrivateRecordsNeedOptIn();
  TestFutureRecordsAreNotYetVisible();
  TestBudgetPacksBestFirst();
  TestSummariesAnswerBroadQueries();
  TestDeletedMemberLeavesSummaries();
  TestArchivedAndPrivateMembersLeaveSummaries();
  TestSummaryWithInactiveMemberIsSkipped();
  TestEmbeddingOutageReturnsNothing();
  std::cout << "retrieval_composer_test: pass" << std::endl;
  return 0;
}
