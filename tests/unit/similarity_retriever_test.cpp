#include "internal/retrieval/similarity_retriever.hpp"

#include <cassert>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "support/scripted_embedding_provider.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::testing::Axis;
using recall::testing::Near0;

namespace {

db::model::MemoryRecord Record(const std::string& owner, const std::string& subject, std::vector<float> embedding) {
  db::model::MemoryRecord r;
  r.owner_id     = owner;
  r.kind         = MEMORY_KIND_FACT;
  r.subject_name = subject;
  r.content      = subject + " fact";
  r.embedding    = std::move(embedding);
  return r;
}

struct Fixture {
  std::shared_ptr<core::MemoryStore>       store = std::make_shared<core::MemoryStore>(std::make_shared<db::memory::MemoryRepository>());
  std::shared_ptr<retrieval::VectorIndex>  index = std::make_shared<retrieval::VectorIndex>();
  retrieval::SimilarityRetriever           retriever{store, index};

  Fixture() {
    store->AddListener(index);
  }
};

void TestRanksAndThresholds() {
  Fixture f;
  auto close  = f.store->Insert(Record("u1", "A", Near0(0.95, 1)));
  auto medium = f.store->Insert(Record("u1", "B", Near0(0.7, 2)));
  f.store->Insert(Record("u1", "C", Near0(0.2, 3)));

  auto hits = f.retriever.FindSimilar("u1", Axis(0), 10, 0.5);
  assert(hits.size() == 2);
  assert(hits[0].record.id == close.id);
  assert(hits[1].record.id == medium.id);
  assert(hits[0].similarity > 0.94 && hits[0].similarity < 0.96);

  assert(f.retriever.FindSimilar("u1", Axis(0), 1, 0.5).size() == 1);
  assert(f.retriever.FindSimilar("u1", Axis(0), 0, 0.5).empty());
}

void TestOwnersAreIsolated() {
  Fixture f;
  f.store->Insert(Record("u1", "A", Axis(0)));
  f.store->Insert(Record("u2", "A", Axis(0)));

  auto hits = f.retriever.FindSimilar("u2", Axis(0), 10, 0.5);
  assert(hits.size() == 1);
  assert(hits[0].record.owner_id == "u2");
  assert(f.retriever.FindSimilar("u3", Axis(0), 10, 0.0).empty());
  // Strictly above the threshold.
  assert(f.retriever.FindSimilar("u1", Axis(0), 10, 1.0).empty());
}

void TestInactiveRecordsNeverReturned() {
  Fixture f;
  auto a = f.store->Insert(Record("u1", "A", Axis(0)));
  auto b = f.store->Insert(Record("u1", "B", Near0(0.9, 1)));
  f.store->SoftDelete(a.id);

  auto hits = f.retriever.FindSimilar("u1", Axis(0), 10, 0.5);
  assert(hits.size() == 1 && hits[0].record.id == b.id);
  assert(f.index->Size("u1") == 1);
}

void TestStaleIndexEntriesAreRevalidated() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = std::make_shared<core::MemoryStore>(repo);
  auto index = std::make_shared<retrieval::VectorIndex>();
  retrieval::SimilarityRetriever retriever(store, index);

  // The index is not listening, so it goes stale.
  auto a = store->Insert(Record("u1", "A", Axis(0)));
  index->Hydrate(*store);
  store->SoftDelete(a.id);
  index->Upsert("u1", "ghost", Axis(0));

  assert(retriever.FindSimilar("u1", Axis(0), 10, 0.5).empty());
  assert(index->Size("u1") == 0);
}

} // namespace

int main() {
  TestRanksAndThresholds();
  TestOwnersAreIsolated();
  TestInactiveRecordsNeverReturned();
  TestStaleIndexEntriesAreRevalidated();
  std::cout << "similarity_retriever_test: pass" << std::endl;
  return 0;
}
