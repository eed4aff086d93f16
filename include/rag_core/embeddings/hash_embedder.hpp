#pragma once

#include "rag_core/embeddings/embedder.hpp"

namespace rag_core {

/**
 * @class HashEmbedder
 * @brief Deterministic, non-semantic placeholder embeddings.
 *
 * The SHA-256 digest of the text seeds a pseudo-random generator, so the same
 * text always maps to the same vector and different texts to unrelated ones.
 * Similarity between these vectors means nothing; they exist so that ingestion
 * and retrieval keep working without a model server.
 */
class HashEmbedder : public Embedder {
 public:
  static constexpr const char* MODEL_ID = "hash-placeholder-v1";

  explicit HashEmbedder(size_t dimension = 48);

  std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override;
  std::vector<float> embed_one(const std::string& text) override;

  size_t dimension() const override { return dimension_; }
  std::string model_id() const override { return MODEL_ID; }
  bool is_semantic() const override { return false; }

 private:
  size_t dimension_;
};

}  // namespace rag_core
