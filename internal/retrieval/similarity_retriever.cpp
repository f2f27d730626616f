#include "internal/retrieval/similarity_retriever.hpp"

#include <stdexcept>

namespace recall::retrieval {

namespace {
// Over-fetch so re-validation drops do not starve the result.
constexpr std::size_t kOverfetch = 2;
} // namespace

SimilarityRetriever::SimilarityRetriever(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<VectorIndex> index)
    : store_(std::move(store)), index_(std::move(index)) {
  if (!store_ || !index_) {
    throw std::invalid_argument("SimilarityRetriever: store and index are required");
  }
}

std::vector<SimilarRecord> SimilarityRetriever::FindSimilar(const std::string& owner_id, const std::vector<float>& embedding,
                                                            std::size_t k, double threshold) const {
  std::vector<SimilarRecord> out;
  if (k == 0) return out;

  for (const auto& hit : index_->Search(owner_id, embedding, k * kOverfetch, threshold)) {
    auto record = store_->GetById(hit.id);
    if (!record || record->owner_id != owner_id) {
      index_->Remove(owner_id, hit.id);
      continue;
    }
    if (record->status != recall::memory::v1::RECORD_STATUS_ACTIVE) {
      index_->OnRecordChanged(*record);
      continue;
    }
    out.push_back({std::move(*record), hit.similarity});
    if (out.size() >= k) break;
  }
  return out;
}

} // namespace recall::retrieval
