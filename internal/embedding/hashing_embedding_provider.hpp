#pragma once

#include "internal/embedding/embedding_provider.hpp"

namespace recall::embedding {

/*
  Signed feature hashing over lowercase word unigrams and bigrams, L2
  normalized. Texts sharing vocabulary land close together, which is all the
  update path and the tests need from an offline provider.
*/
class HashingEmbeddingProvider final : public EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(uint32_t dimensions = 256);

  std::vector<float> Embed(const std::string& text) override;

  std::string ModelName() const override;

  uint32_t Dimensions() const override {
    return dimensions_;
  }

 private:
  uint32_t dimensions_;
};

} // namespace recall::embedding
