#include "rag_core/db/knowledge_store.hpp"

#include <cstring>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/time_format.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/services/compression_service.hpp"
#include "rag_core/types/uuid.hpp"

namespace rag_core {

namespace {

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

std::string placeholders(size_t count) {
  std::string result;
  for (size_t i = 0; i < count; ++i) {
    result += (i == 0) ? "?" : ",?";
  }
  return result;
}

const char *DOCUMENT_COLUMNS =
    "id, chatbot_id, file_name, storage_key, mime_type, size_bytes, checksum, status, error, "
    "created_at, updated_at";

}  // namespace

KnowledgeStore::KnowledgeStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::string KnowledgeStore::create_chatbot(const ChatbotConfig &chatbot) {
  const std::string id = chatbot.id.empty() ? generate_uuid() : chatbot.id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO chatbots (id, name, system_prompt, model_name, temperature, top_k, "
             "created_at) VALUES (?,?,?,?,?,?,?)"
          << id << chatbot.name << chatbot.system_prompt << chatbot.model_name
          << static_cast<double>(chatbot.temperature) << chatbot.top_k
          << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("create_chatbot", e));
  }
  return id;
}

std::optional<ChatbotConfig> KnowledgeStore::get_chatbot(const std::string &chatbot_id) {
  std::optional<ChatbotConfig> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, name, system_prompt, model_name, temperature, top_k FROM chatbots "
             "WHERE id = ?"
          << chatbot_id >>
        [&](std::string id, std::string name, std::string system_prompt, std::string model_name,
            double temperature, int top_k) {
          ChatbotConfig chatbot;
          chatbot.id = std::move(id);
          chatbot.name = std::move(name);
          chatbot.system_prompt = std::move(system_prompt);
          chatbot.model_name = std::move(model_name);
          chatbot.temperature = static_cast<float>(temperature);
          chatbot.top_k = top_k;
          result = std::move(chatbot);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("get_chatbot", e));
  }
  return result;
}

std::vector<ChatbotConfig> KnowledgeStore::list_chatbots() {
  std::vector<ChatbotConfig> chatbots;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, name, system_prompt, model_name, temperature, top_k FROM chatbots "
             "ORDER BY created_at, name" >>
        [&](std::string id, std::string name, std::string system_prompt, std::string model_name,
            double temperature, int top_k) {
          ChatbotConfig chatbot;
          chatbot.id = std::move(id);
          chatbot.name = std::move(name);
          chatbot.system_prompt = std::move(system_prompt);
          chatbot.model_name = std::move(model_name);
          chatbot.temperature = static_cast<float>(temperature);
          chatbot.top_k = top_k;
          chatbots.push_back(std::move(chatbot));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("list_chatbots", e));
  }
  return chatbots;
}

void KnowledgeStore::create_document(const Document &document) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO documents (id, chatbot_id, file_name, storage_key, mime_type, "
             "size_bytes, checksum, status, error, created_at, updated_at) "
             "VALUES (?,?,?,?,?,?,?,?,?,?,?)"
          << document.id << document.chatbot_id << document.file_name << document.storage_key
          << document.mime_type << document.size_bytes << document.checksum
          << to_string(document.status) << document.error
          << time_point_to_string(document.created_at)
          << time_point_to_string(document.updated_at);
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("create_document", e));
  }
}

std::optional<Document> KnowledgeStore::get_document(const std::string &document_id) {
  std::optional<Document> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + DOCUMENT_COLUMNS + " FROM documents WHERE id = ?"
          << document_id >>
        [&](std::string id, std::string chatbot_id, std::string file_name,
            std::string storage_key, std::string mime_type, int64_t size_bytes,
            std::optional<std::string> checksum, std::string status,
            std::optional<std::string> error, std::string created_at, std::string updated_at) {
          Document document;
          document.id = std::move(id);
          document.chatbot_id = std::move(chatbot_id);
          document.file_name = std::move(file_name);
          document.storage_key = std::move(storage_key);
          document.mime_type = std::move(mime_type);
          document.size_bytes = size_bytes;
          document.checksum = checksum.value_or("");
          document.status = document_status_from_string(status);
          document.error = std::move(error);
          document.created_at = string_to_time_point(created_at);
          document.updated_at = string_to_time_point(updated_at);
          result = std::move(document);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("get_document", e));
  }
  return result;
}

std::vector<Document> KnowledgeStore::list_documents(const std::string &chatbot_id) {
  std::vector<Document> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + DOCUMENT_COLUMNS +
                 " FROM documents WHERE chatbot_id = ? ORDER BY created_at, file_name"
          << chatbot_id >>
        [&](std::string id, std::string chatbot_id_db, std::string file_name,
            std::string storage_key, std::string mime_type, int64_t size_bytes,
            std::optional<std::string> checksum, std::string status,
            std::optional<std::string> error, std::string created_at, std::string updated_at) {
          Document document;
          document.id = std::move(id);
          document.chatbot_id = std::move(chatbot_id_db);
          document.file_name = std::move(file_name);
          document.storage_key = std::move(storage_key);
          document.mime_type = std::move(mime_type);
          document.size_bytes = size_bytes;
          document.checksum = checksum.value_or("");
          document.status = document_status_from_string(status);
          document.error = std::move(error);
          document.created_at = string_to_time_point(created_at);
          document.updated_at = string_to_time_point(updated_at);
          documents.push_back(std::move(document));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("list_documents", e));
  }
  return documents;
}

void KnowledgeStore::update_document_status(const std::string &document_id,
                                            DocumentStatus status,
                                            const std::optional<std::string> &error) {
  std::optional<std::string> stored_error;
  if (status == DocumentStatus::Failed) {
    stored_error = error;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET status = ?, error = ?, updated_at = ? WHERE id = ?"
          << to_string(status) << stored_error
          << time_point_to_string(std::chrono::system_clock::now()) << document_id;
    if (conn->rows_modified() == 0) {
      throw KnowledgeStoreError("Document with ID " + document_id + " not found");
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("update_document_status", e));
  }
}

void KnowledgeStore::insert_chunks(const std::vector<ChunkRecord> &chunks,
                                   const std::vector<EmbeddingRecord> &embeddings) {
  if (chunks.size() != embeddings.size()) {
    throw KnowledgeStoreError("insert_chunks: " + std::to_string(chunks.size()) + " chunks but " +
                              std::to_string(embeddings.size()) + " embeddings");
  }
  if (chunks.empty()) {
    return;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    const std::string created_at = time_point_to_string(std::chrono::system_clock::now());

    for (size_t i = 0; i < chunks.size(); ++i) {
      const auto &chunk = chunks[i];
      const auto &embedding = embeddings[i];
      if (embedding.chunk_id != chunk.id) {
        throw KnowledgeStoreError("Embedding " + embedding.id + " does not belong to chunk " +
                                  chunk.id);
      }

      *conn << "INSERT INTO chunks (id, chatbot_id, document_id, chunk_index, content, "
               "token_count, created_at) VALUES (?,?,?,?,?,?,?)"
            << chunk.id << chunk.chatbot_id << chunk.document_id << chunk.chunk_index
            << CompressionService::compress(chunk.content) << chunk.token_count << created_at;

      *conn << "INSERT INTO embeddings (id, chunk_id, dimension, embedding_model, vector_blob) "
               "VALUES (?,?,?,?,?)"
            << embedding.id << embedding.chunk_id << embedding.dimension
            << embedding.embedding_model << vector_to_blob(embedding.vector);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("insert_chunks", e));
  }
}

void KnowledgeStore::delete_document_chunks(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("delete_document_chunks", e));
  }
}

std::vector<ChunkWithSource> KnowledgeStore::get_chunks_by_ids(
    const std::string &chatbot_id, const std::vector<std::string> &chunk_ids) {
  std::vector<ChunkWithSource> chunks;
  if (chunk_ids.empty()) {
    return chunks;
  }

  try {
    PooledConnection conn(db_manager_);
    auto statement = *conn << "SELECT c.id, c.document_id, c.chunk_index, c.content, "
                              "c.token_count, d.file_name FROM chunks c "
                              "JOIN documents d ON d.id = c.document_id "
                              "WHERE c.chatbot_id = ? AND c.id IN (" +
                                  placeholders(chunk_ids.size()) + ")";
    statement << chatbot_id;
    for (const auto &id : chunk_ids) {
      statement << id;
    }
    statement >> [&](std::string id, std::string document_id, int chunk_index,
                     std::vector<char> content, std::optional<int> token_count,
                     std::string file_name) {
      ChunkWithSource row;
      row.chunk.id = std::move(id);
      row.chunk.chatbot_id = chatbot_id;
      row.chunk.document_id = std::move(document_id);
      row.chunk.chunk_index = chunk_index;
      row.chunk.content = CompressionService::decompress(content);
      row.chunk.token_count = token_count;
      row.document_name = std::move(file_name);
      chunks.push_back(std::move(row));
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("get_chunks_by_ids", e));
  }
  return chunks;
}

std::vector<ChunkRecord> KnowledgeStore::list_chunks_for_chatbot(const std::string &chatbot_id) {
  std::vector<ChunkRecord> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.id, c.document_id, c.chunk_index, c.content, c.token_count FROM chunks c "
             "JOIN documents d ON d.id = c.document_id WHERE c.chatbot_id = ? "
             "ORDER BY d.created_at, d.id, c.chunk_index"
          << chatbot_id >>
        [&](std::string id, std::string document_id, int chunk_index, std::vector<char> content,
            std::optional<int> token_count) {
          ChunkRecord chunk;
          chunk.id = std::move(id);
          chunk.chatbot_id = chatbot_id;
          chunk.document_id = std::move(document_id);
          chunk.chunk_index = chunk_index;
          chunk.content = CompressionService::decompress(content);
          chunk.token_count = token_count;
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("list_chunks_for_chatbot", e));
  }
  return chunks;
}

void KnowledgeStore::replace_embeddings(const std::vector<EmbeddingRecord> &embeddings) {
  if (embeddings.empty()) {
    return;
  }
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (const auto &embedding : embeddings) {
      *conn << "DELETE FROM embeddings WHERE chunk_id = ?" << embedding.chunk_id;
      *conn << "INSERT INTO embeddings (id, chunk_id, dimension, embedding_model, vector_blob) "
               "VALUES (?,?,?,?,?)"
            << embedding.id << embedding.chunk_id << embedding.dimension
            << embedding.embedding_model << vector_to_blob(embedding.vector);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("replace_embeddings", e));
  }
}

std::optional<EmbeddingRecord> KnowledgeStore::get_embedding_for_chunk(
    const std::string &chunk_id) {
  std::optional<EmbeddingRecord> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, chunk_id, dimension, embedding_model, vector_blob FROM embeddings "
             "WHERE chunk_id = ?"
          << chunk_id >>
        [&](std::string id, std::string chunk_id_db, int dimension, std::string embedding_model,
            std::vector<char> vector_blob) {
          EmbeddingRecord embedding;
          embedding.id = std::move(id);
          embedding.chunk_id = std::move(chunk_id_db);
          embedding.dimension = dimension;
          embedding.embedding_model = std::move(embedding_model);
          embedding.vector = blob_to_vector(vector_blob);
          result = std::move(embedding);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("get_embedding_for_chunk", e));
  }
  return result;
}

int KnowledgeStore::count_chunks_for_document(const std::string &document_id) {
  int count = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks WHERE document_id = ?" << document_id >> count;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("count_chunks_for_document", e));
  }
  return count;
}

int KnowledgeStore::count_chunks_for_chatbot(const std::string &chatbot_id) {
  int count = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks WHERE chatbot_id = ?" << chatbot_id >> count;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("count_chunks_for_chatbot", e));
  }
  return count;
}

}  // namespace rag_core
