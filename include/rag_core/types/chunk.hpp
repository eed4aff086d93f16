#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rag_core {

// A chunk as it moves through ingestion, before it has an identity.
struct Chunk {
  std::string content;
  int chunk_index = 0;
  std::vector<float> vector_embedding;
};

struct ChunkRecord {
  std::string id;
  std::string chatbot_id;
  std::string document_id;
  int chunk_index = 0;
  std::string content;
  std::optional<int> token_count;
};

struct EmbeddingRecord {
  std::string id;
  std::string chunk_id;
  int dimension = 0;
  std::string embedding_model;
  std::vector<float> vector;
};

}  // namespace rag_core
