#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/embedding/embedding_provider.hpp"

namespace recall::embedding {

struct EmbeddingPolicy {
  std::chrono::milliseconds timeout{2000};
  uint32_t                  max_retries = 2;
};

/*
  Boundary around the embedding collaborator.

  Each attempt runs under the policy timeout; failed or mis-shaped results
  are retried up to max_retries times, then EmbeddingUnavailable is thrown.
*/
class EmbeddingAdapter {
 public:
  EmbeddingAdapter(std::shared_ptr<EmbeddingProvider> provider, EmbeddingPolicy policy);

  std::vector<float> Embed(const std::string& text);

  // Canonical record text: "<subject>: <content>".
  std::vector<float> EmbedRecord(const std::string& subject, const std::string& content);

  static std::string RecordText(const std::string& subject, const std::string& content);

  std::string ModelName() const {
    return provider_->ModelName();
  }

  uint32_t Dimensions() const {
    return provider_->Dimensions();
  }

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  EmbeddingPolicy                    policy_;
};

} // namespace recall::embedding
