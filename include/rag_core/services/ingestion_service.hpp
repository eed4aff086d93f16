#pragma once

#include <filesystem>
#include <string>

#include "rag_core/types/progress.hpp"
#include "rag_core/vector/vector_index.hpp"

namespace rag_core {

class KnowledgeStore;
class ObjectStorage;
class ContentExtractorFactory;
class Embedder;

class IngestionError : public std::exception {
 public:
  explicit IngestionError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IngestionOptions {
  int chunk_size = 500;
  int chunk_overlap = 50;
  // Where downloaded originals are staged; the system temp dir when empty
  std::filesystem::path scratch_directory;
  VectorIndexOptions vector_index;
};

/**
 * @class IngestionService
 * @brief Turns an uploaded document into indexed, searchable chunks.
 *
 * ingest() drives a document through pending -> processing -> {ready | failed}:
 * download to scratch, extract, chunk, embed, persist chunk and embedding rows,
 * append to the chatbot's vector index. Any failure after the document is
 * marked processing is recorded on the document as failed with its message;
 * nothing is retried.
 *
 * Re-ingesting a document that is already ready duplicates its chunks. The
 * dispatcher must not do that; the task queue allows one ingestion task per
 * document.
 */
class IngestionService {
 public:
  IngestionService(KnowledgeStore& store, ObjectStorage& storage,
                   ContentExtractorFactory& extractors, Embedder& embedder,
                   IngestionOptions options);

  IngestionService(const IngestionService&) = delete;
  IngestionService& operator=(const IngestionService&) = delete;

  /**
   * @brief Runs the pipeline for one document.
   *
   * Pipeline failures do not propagate; they end up in the document's status
   * and error. Throws IngestionError only if the document does not exist, and
   * KnowledgeStoreError if its status cannot be written at all.
   */
  void ingest(const std::string& document_id, const ProgressUpdater& on_progress = nullptr);

  /**
   * @brief Re-embeds every chunk of a chatbot and writes a fresh index.
   *
   * This is the required step after changing the embedding model of a chatbot
   * that already has documents; ingestion refuses vectors whose width differs
   * from the existing index.
   *
   * @return Number of chunks in the rebuilt index.
   */
  size_t rebuild_index(const std::string& chatbot_id);

  const IngestionOptions& options() const { return options_; }

 private:
  KnowledgeStore& store_;
  ObjectStorage& storage_;
  ContentExtractorFactory& extractors_;
  Embedder& embedder_;
  IngestionOptions options_;

  std::filesystem::path scratch_path_for(const std::string& file_name) const;
};

}  // namespace rag_core
