#include "internal/maintenance/jobs/resummarize_job.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::maintenance::ExtractiveSummaryWriter;
using recall::maintenance::MemberFingerprint;
using recall::maintenance::ResummarizeJob;
using recall::maintenance::ResummarizePolicy;
using recall::testing::NowMs;
using recall::testing::TestStack;

namespace {

const std::string kOwner = "user-1";

class CountingWriter final : public maintenance::SummaryWriter {
 public:
  std::string Write(const std::string& category, const std::vector<db::model::MemoryRecord>& members,
                    std::size_t max_chars) override {
    ++calls;
    return inner_.Write(category, members, max_chars);
  }

  int calls = 0;

 private:
  ExtractiveSummaryWriter inner_;
};

db::model::MemoryRecord SeedIn(TestStack& stack, const std::string& category, const std::string& subject,
                               const std::string& content, double importance = 0.5) {
  auto              record = stack.Seed(kOwner, MEMORY_KIND_FACT, subject, content, "", importance);
  core::RecordPatch patch;
  patch.category = category;
  return stack.store->Update(record.id, patch);
}

std::optional<db::model::CategorySummaryRecord> Summary(TestStack& stack, const std::string& category) {
  auto tx = stack.repository->Begin();
  return stack.repository->GetCategorySummary(*tx, kOwner, category);
}

std::string RunJob(ResummarizeJob& job, const std::string& payload = "{}") {
  db::model::MaintenanceJobRecord record;
  record.owner_id     = kOwner;
  record.payload_json = payload;
  return job.Run({record, NowMs()});
}

void TestExtractiveWriter() {
  db::model::MemoryRecord a, b, c;
  a.subject_name = "Anna";
  a.content      = "likes jazz.";
  b.subject_name = "Anna";
  b.content      = "plays the cello!";
  c.subject_name = "Marcus";
  c.content      = "";

  ExtractiveSummaryWriter writer;
  assert(writer.Write("preferences", {a, b, c}, 0) == "Anna: likes jazz. Anna: plays the cello.");
  assert(writer.Write("preferences", {a, b}, 20) == "Anna: likes jazz.");
  // One member is always kept, even past the limit.
  assert(writer.Write("preferences", {b}, 5) == "Anna: plays the cello.");
}

void TestFingerprintTracksRevisions() {
  db::model::MemoryRecord a, b;
  a.id       = "a";
  a.revision = 1;
  b.id       = "b";
  b.revision = 4;
  const auto base = MemberFingerprint({a, b});
  assert(base.size() == 16);
  assert(MemberFingerprint({b, a}) == base);

  b.revision = 5;
  assert(MemberFingerprint({a, b}) != base);
}

void TestWritesOnlyWhenMembersChange() {
  TestStack stack;
  auto      jazz = SeedIn(stack, "preferences", "Anna", "likes jazz", 0.4);
  SeedIn(stack, "preferences", "Anna", "prefers window seats", 0.9);
  SeedIn(stack, "work_life", "Marcus", "manages the platform team");

  auto           writer = std::make_shared<CountingWriter>();
  ResummarizeJob job(stack.store, writer, ResummarizePolicy{});

  assert(RunJob(job) == "written=2 unchanged=0 dropped=0");
  auto prefs = Summary(stack, "preferences");
  assert(prefs && prefs->version == 1);
  // Most important member first.
  assert(prefs->summary_text == "Anna: prefers window seats. Anna: likes jazz.");
  assert(prefs->member_record_ids.size() == 2);

  // Same members: no writer call, no new version.
  assert(RunJob(job) == "written=0 unchanged=2 dropped=0");
  assert(writer->calls == 2);
  assert(Summary(stack, "preferences")->version == 1);

  core::RecordPatch patch;
  patch.content = "likes jazz and blues";
  stack.store->Update(jazz.id, patch);
  assert(RunJob(job) == "written=1 unchanged=1 dropped=0");
  prefs = Summary(stack, "preferences");
  assert(prefs->version == 2);
  assert(prefs->summary_text.find("likes jazz and blues") != std::string::npos);
}

void TestEmptyCategoryIsDropped() {
  TestStack stack;
  auto      marcus = SeedIn(stack, "work_life", "Marcus", "manages the platform team");
  ResummarizeJob job(stack.store, std::make_shared<ExtractiveSummaryWriter>(), ResummarizePolicy{});
  RunJob(job);
  assert(Summary(stack, "work_life"));

  stack.store->SoftDelete(marcus.id);
  assert(RunJob(job) == "written=0 unchanged=0 dropped=1");
  assert(!Summary(stack, "work_life"));
}

void TestPrivateRecordsStayOut() {
  TestStack stack;
  SeedIn(stack, "health_wellness", "Anna", "runs every morning");
  auto therapy = SeedIn(stack, "health_wellness", "Anna", "sees a therapist weekly");
  core::RecordPatch patch;
  patch.sensitivity = SENSITIVITY_PRIVATE;
  stack.store->Update(therapy.id, patch);

  ResummarizeJob job(stack.store, std::make_shared<ExtractiveSummaryWriter>(), ResummarizePolicy{});
  RunJob(job);
  auto health = Summary(stack, "health_wellness");
  assert(health);
  assert(health->summary_text == "Anna: runs every morning.");
}

void TestPayloadLimitsCategoriesAndMembers() {
  TestStack stack;
  SeedIn(stack, "preferences", "Anna", "likes jazz", 0.9);
  SeedIn(stack, "preferences", "Anna", "likes tea", 0.5);
  SeedIn(stack, "preferences", "Anna", "likes rain", 0.1);
  SeedIn(stack, "work_life", "Marcus", "manages the platform team");

  ResummarizePolicy policy;
  policy.max_members = 2;
  ResummarizeJob job(stack.store, std::make_shared<ExtractiveSummaryWriter>(), policy);

  assert(RunJob(job, R"({"categories": ["preferences"]})") == "written=1 unchanged=0 dropped=0");
  assert(!Summary(stack, "work_life"));
  auto prefs = Summary(stack, "preferences");
  assert(prefs->member_record_ids.size() == 2);
  assert(prefs->summary_text.find("likes rain") == std::string::npos);
}

void TestWriterIsRequired() {
  TestStack stack;
  bool      thrown = false;
  try {
    ResummarizeJob job(stack.store, nullptr, ResummarizePolicy{});
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestExtractiveWriter();
  TestFingerprintTracksRevisions();
  TestWritesOnlyWhenMembersChange();
  TestEmptyCategoryIsDropped();
  TestPrivateRecordsStayOut();
  TestPayloadLimitsCategoriesAndMembers();
  TestWriterIsRequired();
  std::cout << "resummarize_job_test: pass" << std::endl;
  return 0;
}
