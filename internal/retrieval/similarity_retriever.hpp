#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_store.hpp"
#include "internal/retrieval/vector_index.hpp"

namespace recall::retrieval {

struct SimilarRecord {
  db::model::MemoryRecord record;
  double                  similarity = 0.0;
};

/*
  FindSimilar over the vector index.

  Every hit is re-read from the store and dropped unless it is still ACTIVE
  and owned by the caller, so a lagging index never leaks stale rows.
*/
class SimilarityRetriever {
 public:
  SimilarityRetriever(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<VectorIndex> index);

  std::vector<SimilarRecord> FindSimilar(const std::string& owner_id, const std::vector<float>& embedding, std::size_t k,
                                         double threshold) const;

 private:
  std::shared_ptr<core::MemoryStore> store_;
  std::shared_ptr<VectorIndex>       index_;
};

} // namespace recall::retrieval
