#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/core/memory_store.hpp"

namespace recall::retrieval {

struct IndexHit {
  std::string id;
  double      similarity = 0.0;
};

/*
  Owner-partitioned in-memory vector index over ACTIVE records.

  Hydrated from the store at startup and kept current as a store listener.
  The index may briefly lag the store; readers re-validate hits.
*/
class VectorIndex final : public core::StoreListener {
 public:
  // Loads every owner's active, embedded records. Returns the entry count.
  std::size_t Hydrate(core::MemoryStore& store);

  void Upsert(const std::string& owner_id, const std::string& id, std::vector<float> embedding);
  void Remove(const std::string& owner_id, const std::string& id);

  // Entries with cosine strictly above threshold, best first, at most k.
  std::vector<IndexHit> Search(const std::string& owner_id, const std::vector<float>& query, std::size_t k,
                               double threshold) const;

  std::size_t Size(const std::string& owner_id) const;

  void OnRecordChanged(const db::model::MemoryRecord& record) override;
  void OnRecordRemoved(const std::string& owner_id, const std::string& id) override;

 private:
  using Partition = std::unordered_map<std::string, std::vector<float>>;

  mutable std::shared_mutex                  mutex_;
  std::unordered_map<std::string, Partition> owners_;
};

} // namespace recall::retrieval
