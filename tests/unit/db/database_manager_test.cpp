#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <vector>

#include "rag_core/db/pooled_connection.hpp"
#include "utilities_test.hpp"

namespace rag_core {

class DatabaseManagerTest : public rag_tests::KnowledgeStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"chatbots",   "documents",  "chunks",
                                              "embeddings", "task_queue", "task_progress"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  std::vector<std::string> indexes = {"idx_task_queue_status_priority",
                                      "idx_task_queue_type_target", "idx_documents_chatbot",
                                      "idx_chunks_chatbot"};
  for (const auto& index : indexes) {
    int idx_count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name=?" << index >>
        idx_count;
    EXPECT_EQ(idx_count, 1) << "Missing index: " << index;
  }

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, ReopeningKeepsData) {
  const std::string chatbot_id = add_chatbot("Persistent");
  store_.reset();
  task_queue_repo_.reset();
  db_manager_->shutdown();

  db_manager_ = std::make_unique<DatabaseManager>(temp_dir_ / "rag.db", 2);
  store_ = std::make_shared<KnowledgeStore>(*db_manager_);
  auto chatbot = store_->get_chatbot(chatbot_id);
  ASSERT_TRUE(chatbot.has_value());
  EXPECT_EQ(chatbot->name, "Persistent");
}

TEST_F(DatabaseManagerTest, ShutdownIsIdempotent) {
  db_manager_->shutdown();
  db_manager_->shutdown();
  EXPECT_THROW(db_manager_->get_connection(), std::runtime_error);
}

}  // namespace rag_core
