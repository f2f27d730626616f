#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace recall::embedding {

/*
  Embedding function abstraction (text -> vector).

  Implementations may block on I/O and may throw on failure; the
  EmbeddingAdapter owns timeouts, retries and shape checks.

  Implementations:
    HashingEmbeddingProvider -> deterministic feature hashing, in-process
    (remote model providers are injected by embedders of the library)
*/
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> Embed(const std::string& text) = 0;

  // Stored on each record; reindex re-embeds rows with a different name.
  virtual std::string ModelName() const = 0;

  virtual uint32_t Dimensions() const = 0;
};

} // namespace recall::embedding
