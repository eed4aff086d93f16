#include "rag_core/db/database_manager.hpp"

#include <stdexcept>

namespace rag_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema();

  // 2. Create the connection pool for workers to use
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS chatbots (
          id TEXT PRIMARY KEY,
          name TEXT NOT NULL,
          system_prompt TEXT NOT NULL DEFAULT '',
          model_name TEXT NOT NULL DEFAULT '',
          temperature REAL NOT NULL DEFAULT 0.2,
          top_k INTEGER NOT NULL DEFAULT 4,
          created_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id TEXT PRIMARY KEY,
          chatbot_id TEXT NOT NULL,
          file_name TEXT NOT NULL,
          storage_key TEXT NOT NULL,
          mime_type TEXT NOT NULL,
          size_bytes INTEGER NOT NULL,
          checksum TEXT,
          status TEXT NOT NULL DEFAULT 'pending',
          error TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL,
          FOREIGN KEY (chatbot_id) REFERENCES chatbots(id) ON DELETE CASCADE
      )
    )";

  // chunk content is stored zstd-compressed
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          chatbot_id TEXT NOT NULL,
          document_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          token_count INTEGER,
          created_at TEXT NOT NULL,
          UNIQUE (document_id, chunk_index),
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS embeddings (
          id TEXT PRIMARY KEY,
          chunk_id TEXT NOT NULL UNIQUE,
          dimension INTEGER NOT NULL,
          embedding_model TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          FOREIGN KEY (chunk_id) REFERENCES chunks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_queue (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_type TEXT NOT NULL,
          target_id TEXT NOT NULL,
          status TEXT NOT NULL DEFAULT 'PENDING',
          priority INTEGER NOT NULL DEFAULT 10,
          error_message TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_progress (
          task_id INTEGER PRIMARY KEY,
          progress_percent REAL NOT NULL DEFAULT 0.0,
          status_message TEXT NOT NULL DEFAULT 'Initializing...',
          updated_at TEXT NOT NULL,
          FOREIGN KEY (task_id) REFERENCES task_queue(id) ON DELETE CASCADE
      )
    )";

  db << "CREATE INDEX IF NOT EXISTS idx_documents_chatbot ON documents(chatbot_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_chatbot ON chunks(chatbot_id)";
  // One ingestion task per document, ever.
  db << R"(
      CREATE UNIQUE INDEX IF NOT EXISTS idx_task_queue_type_target
      ON task_queue(task_type, target_id)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_task_queue_status_priority
      ON task_queue(status, priority, created_at)
    )";
}

}  // namespace rag_core
