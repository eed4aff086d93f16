#include "rag_core/embeddings/hash_embedder.hpp"

#include <cstdint>
#include <random>

#include "rag_core/services/hash_service.hpp"

namespace rag_core {

HashEmbedder::HashEmbedder(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw EmbedderError("Placeholder embedding dimension must be positive");
  }
}

std::vector<std::vector<float>> HashEmbedder::embed_many(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

std::vector<float> HashEmbedder::embed_one(const std::string& text) {
  const auto digest = HashService::sha256(text);

  uint64_t seed = 0;
  for (int i = 0; i < 8; ++i) {
    seed = (seed << 8) | digest[i];
  }

  // mt19937_64 output is fully specified by the standard, unlike the
  // distributions, so the values are derived from raw draws.
  std::mt19937_64 generator(seed);
  std::vector<float> vector(dimension_);
  for (size_t i = 0; i < dimension_; ++i) {
    const uint64_t draw = generator() >> 40;
    vector[i] = static_cast<float>(static_cast<double>(draw) / static_cast<double>(1 << 24));
  }
  return vector;
}

}  // namespace rag_core
