#include "internal/core/memory_store.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using namespace recall;
using namespace recall::memory::v1;

namespace {

db::model::MemoryRecord Record(const std::string& owner, const std::string& subject, const std::string& content,
                               const std::string& predicate = {}) {
  db::model::MemoryRecord r;
  r.owner_id     = owner;
  r.kind         = MEMORY_KIND_FACT;
  r.subject_name = subject;
  r.content      = content;
  r.predicate    = predicate;
  r.importance   = 0.5;
  r.category     = "general";
  return r;
}

class CountingListener final : public core::StoreListener {
 public:
  void OnRecordChanged(const db::model::MemoryRecord&) override {
    ++changed;
  }
  void OnRecordRemoved(const std::string&, const std::string&) override {
    ++removed;
  }
  void OnSummariesInvalidated(const std::string&, const std::vector<std::string>& categories) override {
    invalidated.insert(invalidated.end(), categories.begin(), categories.end());
  }

  std::atomic<int>         changed{0};
  std::atomic<int>         removed{0};
  std::vector<std::string> invalidated;
};

void PutSummary(db::Repository& repo, const std::string& owner, const std::string& category,
                const std::vector<std::string>& members) {
  db::model::CategorySummaryRecord summary;
  summary.owner_id           = owner;
  summary.category           = category;
  summary.summary_text       = category + " summary";
  summary.member_record_ids  = members;
  summary.member_fingerprint = "f";
  summary.version            = 3;
  auto tx = repo.Begin();
  assert(repo.UpsertCategorySummary(*tx, summary));
  tx->Commit();
}

std::string SummaryText(db::Repository& repo, const std::string& owner, const std::string& category) {
  auto tx      = repo.Begin();
  auto summary = repo.GetCategorySummary(*tx, owner, category);
  assert(summary.has_value());
  return summary->summary_text;
}

void TestInsertAssignsIdentityAndRevision() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto r = store.Insert(Record("u1", "  Marcus ", "works at Google", "employer"));
  assert(util::IsCanonicalId(r.id));
  assert(r.subject_name == "Marcus");
  assert(r.status == RECORD_STATUS_ACTIVE);
  assert(r.version == 1 && r.revision == 1);
  assert(r.created_at_ms > 0);

  auto loaded = store.GetById(r.id);
  assert(loaded && loaded->content == "works at Google");
}

void TestSlotUniqueness() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto first = store.Insert(Record("u1", "Marcus", "works at Google", "employer"));

  bool conflicted = false;
  try {
    store.Insert(Record("u1", "marcus", "works at Meta", "Employer"));
  } catch (const util::SlotConflict& e) {
    conflicted = true;
    assert(e.OccupantId() == first.id);
  }
  assert(conflicted);

  // Other owners and predicate-less records do not collide.
  store.Insert(Record("u2", "Marcus", "works at Meta", "employer"));
  store.Insert(Record("u1", "Marcus", "likes chess"));
  store.Insert(Record("u1", "Marcus", "likes go"));
  assert(store.ListActive("u1").size() == 3);
}

void TestUpdateRejectsStaleRevision() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto r = store.Insert(Record("u1", "Anna", "lives in Oslo", "city"));

  core::RecordPatch patch;
  patch.content = "lives in Bergen";
  auto updated  = store.Update(r.id, patch, r.revision);
  assert(updated.revision == 2);
  assert(updated.version == 1);

  bool stale = false;
  try {
    store.Update(r.id, patch, r.revision);
  } catch (const util::SlotConflict&) {
    stale = true;
  }
  assert(stale);
}

void TestSupersedeBuildsChain() {
  auto              listener = std::make_shared<CountingListener>();
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  store.AddListener(listener);

  auto v1 = store.Insert(Record("u1", "Marcus", "works at Google", "employer"));
  auto v2 = store.Supersede(v1.id, Record("u1", "", "works at Meta"), v1.revision);

  assert(v2.old_record.status == RECORD_STATUS_SUPERSEDED);
  assert(v2.old_record.is_historical);
  assert(v2.old_record.superseded_by_id == v2.new_record.id);
  assert(v2.new_record.supersedes_id == v1.id);
  assert(v2.new_record.subject_name == "Marcus");
  assert(v2.new_record.predicate == "employer");
  assert(v2.new_record.version == 2);

  auto v3 = store.Supersede(v2.new_record.id, Record("u1", "", "works at OpenAI"));

  auto chain = store.VersionChain(v2.new_record.id);
  assert(chain.size() == 3);
  assert(chain[0].id == v1.id);
  assert(chain[2].id == v3.new_record.id);
  assert(store.ChainHead(v1.id).id == v3.new_record.id);

  auto slot = store.GetActiveBySlot("u1", "MARCUS", "employer");
  assert(slot && slot->id == v3.new_record.id);
  assert(listener->changed.load() == 5);

  // Superseded rows are immutable through the store.
  bool rejected = false;
  try {
    store.Supersede(v1.id, Record("u1", "", "works at IBM"));
  } catch (const util::SlotConflict& e) {
    rejected = true;
    assert(e.OccupantId() == v2.new_record.id);
  }
  assert(rejected);
}

void TestConcurrentSupersedeOfOneHead() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto              head = store.Insert(Record("u1", "Marcus", "works at Google", "employer"));

  constexpr int            kWriters = 8;
  std::atomic<int>         applied{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&, i] {
      try {
        store.Supersede(head.id, Record("u1", "", "works at company " + std::to_string(i)), head.revision);
        ++applied;
      } catch (const util::SlotConflict&) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(applied.load() == 1);
  assert(conflicts.load() == kWriters - 1);

  db::model::MemoryFilter filter;
  filter.owner_id = "u1";
  filter.status   = RECORD_STATUS_ACTIVE;
  assert(store.List(filter).size() == 1);
  assert(store.VersionChain(head.id).size() == 2);
}

void TestSoftDeleteIsIdempotent() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto r = store.Insert(Record("u1", "Anna", "lives in Oslo", "city"));

  auto archived = store.SoftDelete(r.id, r.revision);
  assert(archived.status == RECORD_STATUS_ARCHIVED);
  auto again = store.SoftDelete(r.id, r.revision);
  assert(again.status == RECORD_STATUS_ARCHIVED);
  assert(again.revision == archived.revision);

  // The slot is free again.
  store.Insert(Record("u1", "Anna", "lives in Bergen", "city"));
  assert(store.ListActive("u1").size() == 1);
}

void TestHardDeleteNotifiesRemoval() {
  auto              listener = std::make_shared<CountingListener>();
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  store.AddListener(listener);

  auto r       = store.Insert(Record("u1", "Anna", "lives in Oslo"));
  auto removed = store.HardDelete(r.id);
  assert(removed.id == r.id);
  assert(!store.GetById(r.id));
  assert(listener->removed.load() == 1);

  bool missing = false;
  try {
    store.HardDelete(r.id);
  } catch (const util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestConsolidateArchivesOther() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto keeper = store.Insert(Record("u1", "Robert", "plays tennis"));
  auto other  = store.Insert(Record("u1", "Bob", "plays tennis on Sundays"));

  auto merged = store.Consolidate(keeper.id, keeper.revision, other.id, other.revision, "plays tennis. plays tennis on Sundays");
  assert(merged.content == "plays tennis. plays tennis on Sundays");
  assert(merged.aliases.size() == 1 && merged.aliases[0] == "Bob");

  auto archived = store.GetById(other.id);
  assert(archived->status == RECORD_STATUS_ARCHIVED);
  assert(archived->superseded_by_id == keeper.id);

  // Consolidation links are not version links.
  assert(store.VersionChain(other.id).size() == 1);
  assert(store.ChainHead(other.id).id == keeper.id);
}

void TestRecordAccessKeepsRevision() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto r = store.Insert(Record("u1", "Anna", "lives in Oslo"));
  store.RecordAccess("u1", {r.id}, "batch-1", 1000);
  store.RecordAccess("u2", {r.id}, "batch-2", 2000);

  auto loaded = store.GetById(r.id);
  assert(loaded->access_count == 1);
  assert(loaded->last_accessed_at_ms == 1000);
  assert(loaded->revision == r.revision);
}

void TestChainCycleIsDetected() {
  auto              repo = std::make_shared<db::memory::MemoryRepository>();
  core::MemoryStore store(repo);
  auto a = store.Insert(Record("u1", "Anna", "a"));
  auto b = store.Insert(Record("u1", "Anna", "b"));

  // Corrupt the rows directly to form a loop.
  auto tx = repo->Begin();
  a.superseded_by_id = b.id;
  b.superseded_by_id = a.id;
  const auto first  = repo->UpdateMemory(*tx, a);
  const auto second = repo->UpdateMemory(*tx, b);
  assert(first && second);
  tx->Commit();

  bool detected = false;
  try {
    store.ChainHead(a.id);
  } catch (const util::InvariantViolation&) {
    detected = true;
  }
  assert(detected);
}

void TestLeavingActiveSetBlanksSummaries() {
  auto              repo     = std::make_shared<db::memory::MemoryRepository>();
  auto              listener = std::make_shared<CountingListener>();
  core::MemoryStore store(repo);
  store.AddListener(listener);

  auto affair = store.Insert(Record("u1", "Anna", "secret affair with her boss"));
  auto team   = store.Insert(Record("u1", "Marcus", "manages the platform team"));
  auto chess  = store.Insert(Record("u1", "Marcus", "plays chess"));
  PutSummary(*repo, "u1", "work_life", {affair.id, team.id});
  PutSummary(*repo, "u1", "hobbies", {chess.id});

  // Bookkeeping-only edits keep the summary.
  core::RecordPatch importance;
  importance.importance = 0.9;
  store.Update(team.id, importance);
  assert(SummaryText(*repo, "u1", "work_life") == "work_life summary");
  assert(listener->invalidated.empty());

  store.HardDelete(affair.id);
  assert(SummaryText(*repo, "u1", "work_life").empty());
  assert(SummaryText(*repo, "u1", "hobbies") == "hobbies summary");
  assert(listener->invalidated == std::vector<std::string>{"work_life"});
  {
    auto tx = repo->Begin();
    auto blank = repo->GetCategorySummary(*tx, "u1", "work_life");
    assert(blank->version == 3);
    assert(blank->member_record_ids.empty());
  }

  PutSummary(*repo, "u1", "work_life", {team.id});
  store.Supersede(team.id, Record("u1", "", "leads the data team"));
  assert(SummaryText(*repo, "u1", "work_life").empty());

  store.SoftDelete(chess.id);
  assert(SummaryText(*repo, "u1", "hobbies").empty());
  assert(listener->invalidated.size() == 3);
}

void TestConsolidateBlanksSummariesOfBoth() {
  auto              repo     = std::make_shared<db::memory::MemoryRepository>();
  auto              listener = std::make_shared<CountingListener>();
  core::MemoryStore store(repo);
  store.AddListener(listener);

  auto keeper = store.Insert(Record("u1", "Mom", "likes gardening"));
  auto other  = store.Insert(Record("u1", "Mother", "likes gardening a lot"));
  PutSummary(*repo, "u1", "hobbies", {keeper.id});
  PutSummary(*repo, "u1", "family", {other.id});

  store.Consolidate(keeper.id, keeper.revision, other.id, other.revision, "likes gardening a lot");
  assert(SummaryText(*repo, "u1", "hobbies").empty());
  assert(SummaryText(*repo, "u1", "family").empty());
  assert(listener->invalidated.size() == 2);
}

void TestSubjectLocksAreReleased() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  for (int i = 0; i < 100; ++i) {
    auto r = store.Insert(Record("u1", "Person " + std::to_string(i), "note " + std::to_string(i)));
    core::RecordPatch patch;
    patch.content = "updated note " + std::to_string(i);
    store.Update(r.id, patch);
  }
  assert(store.TrackedSubjects() == 0);

  // Writers contending on one subject leave nothing behind either.
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, t] {
      for (int i = 0; i < 25; ++i) store.Insert(Record("u1", "Anna", "fact " + std::to_string(t * 100 + i)));
    });
  }
  for (auto& w : writers) w.join();
  assert(store.TrackedSubjects() == 0);
  assert(store.ListActive("u1").size() == 200);
}

void TestRecordSentimentKeepsRollingAverage() {
  core::MemoryStore store(std::make_shared<db::memory::MemoryRepository>());
  auto sister = store.Insert(Record("u1", "Anna", "is my sister"));
  auto job    = store.Insert(Record("u1", "anna", "works at Acme", "employer"));

  assert(std::fabs(store.RecordSentiment(sister.id, 1.0, "conv-1", 1000) - 1.0) < 1e-9);
  assert(std::fabs(store.RecordSentiment(sister.id, 0.0, "conv-2", 2000) - 0.5) < 1e-9);
  // Samples are kept per subject, not per record.
  const double mixed = store.RecordSentiment(job.id, -0.4, "conv-3", 3000);
  assert(std::fabs(mixed - 0.2) < 1e-9);

  auto stored = store.GetById(job.id);
  assert(stored->sentiment_average.has_value());
  assert(std::fabs(*stored->sentiment_average - 0.2) < 1e-9);
  assert(stored->revision == job.revision);

  // Only the most recent samples count.
  double average = 0.0;
  for (int i = 0; i < 20; ++i) average = store.RecordSentiment(sister.id, -0.25, "conv-4", 4000 + i);
  assert(std::fabs(average + 0.25) < 1e-9);
  assert(std::fabs(*store.GetById(sister.id)->sentiment_average + 0.25) < 1e-9);

  bool missing = false;
  try {
    store.RecordSentiment("no-such-record", 0.5, "conv-5", 5000);
  } catch (const util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

} // namespace

int main() {
  TestInsertAssignsIdentityAndRevision();
  TestSlotUniqueness();
  TestUpdateRejectsStaleRevision();
  TestSupersedeBuildsChain();
  TestConcurrentSupersedeOfOneHead();
  TestSoftDeleteIsIdempotent();
  TestHardDeleteNotifiesRemoval();
  TestConsolidateArchivesOther();
  TestRecordAccessKeepsRevision();
  TestChainCycleIsDetected();
  TestLeavingActiveSetBlanksSummaries();
  TestConsolidateBlanksSummariesOfBoth();
  TestSubjectLocksAreReleased();
  TestRecordSentimentKeepsRollingAverage();
  std::cout << "memory_store_test: pass" << std::endl;
  return 0;
}
