#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class KnowledgeStoreError : public std::exception {
 public:
  explicit KnowledgeStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A chunk joined with the display name of its parent document
struct ChunkWithSource {
  ChunkRecord chunk;
  std::string document_name;
};

/**
 * Relational storage of chatbots, documents, chunks and embeddings.
 *
 * Chunk content is stored zstd-compressed and returned decompressed.
 */
class KnowledgeStore {
 public:
  explicit KnowledgeStore(DatabaseManager &db_manager);
  ~KnowledgeStore() = default;

  KnowledgeStore(const KnowledgeStore &) = delete;
  KnowledgeStore &operator=(const KnowledgeStore &) = delete;

  // Chatbots. An empty id is replaced by a fresh UUID; the id is returned.
  std::string create_chatbot(const ChatbotConfig &chatbot);
  std::optional<ChatbotConfig> get_chatbot(const std::string &chatbot_id);
  std::vector<ChatbotConfig> list_chatbots();

  // Documents
  void create_document(const Document &document);
  std::optional<Document> get_document(const std::string &document_id);
  std::vector<Document> list_documents(const std::string &chatbot_id);
  // The error is kept only for DocumentStatus::Failed
  void update_document_status(const std::string &document_id, DocumentStatus status,
                              const std::optional<std::string> &error = std::nullopt);

  /*
  Inserts a document's chunk rows and their embedding rows in one transaction.
  embeddings[i] must belong to chunks[i].
  */
  void insert_chunks(const std::vector<ChunkRecord> &chunks,
                     const std::vector<EmbeddingRecord> &embeddings);

  // Removes a document's chunks; embeddings follow by cascade
  void delete_document_chunks(const std::string &document_id);

  // Chunks of one chatbot with the given ids, in no particular order. Unknown ids are skipped.
  std::vector<ChunkWithSource> get_chunks_by_ids(const std::string &chatbot_id,
                                                 const std::vector<std::string> &chunk_ids);

  // Every chunk of a chatbot, ordered by document then chunk_index
  std::vector<ChunkRecord> list_chunks_for_chatbot(const std::string &chatbot_id);

  // Replaces the embedding row of each referenced chunk
  void replace_embeddings(const std::vector<EmbeddingRecord> &embeddings);

  std::optional<EmbeddingRecord> get_embedding_for_chunk(const std::string &chunk_id);

  int count_chunks_for_document(const std::string &document_id);
  int count_chunks_for_chatbot(const std::string &chatbot_id);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace rag_core
