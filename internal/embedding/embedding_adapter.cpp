#include "internal/embedding/embedding_adapter.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"

namespace recall::embedding {

EmbeddingAdapter::EmbeddingAdapter(std::shared_ptr<EmbeddingProvider> provider, EmbeddingPolicy policy)
    : provider_(std::move(provider)), policy_(policy) {
  if (!provider_) {
    throw std::invalid_argument("EmbeddingAdapter: provider is required");
  }
}

std::string EmbeddingAdapter::RecordText(const std::string& subject, const std::string& content) {
  return subject + ": " + content;
}

std::vector<float> EmbeddingAdapter::EmbedRecord(const std::string& subject, const std::string& content) {
  return Embed(RecordText(subject, content));
}

std::vector<float> EmbeddingAdapter::Embed(const std::string& text) {
  const auto  expected = provider_->Dimensions();
  std::string last_error;

  for (uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
    try {
      auto provider = provider_;
      auto vector   = util::RunWithTimeout([provider, text] { return provider->Embed(text); }, policy_.timeout, "embed");

      if (vector.size() != expected) {
        last_error = "dimension mismatch: got " + std::to_string(vector.size()) + ", expected " + std::to_string(expected);
      } else {
        bool finite = true;
        for (float x : vector) finite = finite && std::isfinite(x);
        if (finite) return vector;
        last_error = "non-finite component";
      }
    } catch (const std::exception& e) {
      last_error = e.what();
    }

    RECALL_LOG_WARN("embedding attempt failed",
                    {observability::StringField("model", provider_->ModelName()),
                     observability::IntField("attempt", attempt + 1), observability::StringField("error", last_error)});
  }

  throw util::EmbeddingUnavailable("embedding failed after " + std::to_string(policy_.max_retries + 1) +
                                   " attempts: " + last_error);
}

} // namespace recall::embedding
