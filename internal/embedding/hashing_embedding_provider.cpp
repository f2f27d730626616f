#include "internal/embedding/hashing_embedding_provider.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/util/text.hpp"

namespace recall::embedding {

namespace {

uint64_t Fnv1a(std::string_view s) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

void AddFeature(std::vector<float>& v, std::string_view feature, float weight) {
  const auto hash   = Fnv1a(feature);
  const auto bucket = static_cast<std::size_t>(hash % v.size());
  v[bucket] += (hash >> 63) ? -weight : weight;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(uint32_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw std::invalid_argument("hashing embedding: dimensions must be > 0");
  }
}

std::string HashingEmbeddingProvider::ModelName() const {
  return "hashing-v1-" + std::to_string(dimensions_);
}

std::vector<float> HashingEmbeddingProvider::Embed(const std::string& text) {
  std::vector<float> v(dimensions_, 0.0f);

  const auto tokens = util::Tokenize(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    AddFeature(v, tokens[i], 1.0f);
    if (i + 1 < tokens.size()) {
      AddFeature(v, tokens[i] + ' ' + tokens[i + 1], 0.5f);
    }
  }

  double norm = 0.0;
  for (float x : v) norm += static_cast<double>(x) * x;
  if (norm > 0.0) {
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (auto& x : v) x *= inv;
  }
  return v;
}

} // namespace recall::embedding
