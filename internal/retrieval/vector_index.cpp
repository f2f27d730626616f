#include "internal/retrieval/vector_index.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/text.hpp"

namespace recall::retrieval {

std::size_t VectorIndex::Hydrate(core::MemoryStore& store) {
  std::unordered_map<std::string, Partition> loaded;
  std::size_t                                count = 0;

  for (const auto& owner : store.Owners()) {
    auto& partition = loaded[owner];
    for (auto& record : store.ListActive(owner)) {
      if (record.embedding.empty()) continue;
      partition[record.id] = std::move(record.embedding);
      ++count;
    }
  }

  std::unique_lock lock(mutex_);
  owners_ = std::move(loaded);
  return count;
}

void VectorIndex::Upsert(const std::string& owner_id, const std::string& id, std::vector<float> embedding) {
  std::unique_lock lock(mutex_);
  owners_[owner_id][id] = std::move(embedding);
}

void VectorIndex::Remove(const std::string& owner_id, const std::string& id) {
  std::unique_lock lock(mutex_);
  auto             it = owners_.find(owner_id);
  if (it == owners_.end()) return;
  it->second.erase(id);
  if (it->second.empty()) owners_.erase(it);
}

std::vector<IndexHit> VectorIndex::Search(const std::string& owner_id, const std::vector<float>& query, std::size_t k,
                                          double threshold) const {
  std::vector<IndexHit> hits;
  if (k == 0 || query.empty()) return hits;

  {
    std::shared_lock lock(mutex_);
    auto             it = owners_.find(owner_id);
    if (it == owners_.end()) return hits;

    for (const auto& [id, embedding] : it->second) {
      const auto similarity = util::CosineSimilarity(query, embedding);
      if (similarity > threshold) hits.push_back({id, similarity});
    }
  }

  std::sort(hits.begin(), hits.end(), [](const IndexHit& a, const IndexHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.id < b.id;
  });
  if (hits.size() > k) hits.resize(k);
  return hits;
}

std::size_t VectorIndex::Size(const std::string& owner_id) const {
  std::shared_lock lock(mutex_);
  auto             it = owners_.find(owner_id);
  return it == owners_.end() ? 0 : it->second.size();
}

void VectorIndex::OnRecordChanged(const db::model::MemoryRecord& record) {
  if (record.status == recall::memory::v1::RECORD_STATUS_ACTIVE && !record.embedding.empty()) {
    Upsert(record.owner_id, record.id, record.embedding);
  } else {
    Remove(record.owner_id, record.id);
  }
}

void VectorIndex::OnRecordRemoved(const std::string& owner_id, const std::string& id) {
  Remove(owner_id, id);
}

} // namespace recall::retrieval
