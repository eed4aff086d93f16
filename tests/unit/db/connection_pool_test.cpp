#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "rag_core/db/connection_pool.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/transaction.hpp"
#include "utilities_test.hpp"

namespace rag_core {

class ConnectionPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = rag_tests::TestUtilities::create_temp_dir("rag_pool_tests");
    // Use a larger pool in this suite to validate multi-connection behavior
    mgr_ = std::make_unique<DatabaseManager>(temp_dir_ / "pool.db", /*pool_size*/ 4);
  }

  void TearDown() override {
    mgr_.reset();
    rag_tests::TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::unique_ptr<DatabaseManager> mgr_;
};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  // Borrow two connections
  PooledConnection c1(*mgr_);
  PooledConnection c2(*mgr_);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*mgr_);
  auto holder2 = std::make_unique<PooledConnection>(*mgr_);
  auto holder3 = std::make_unique<PooledConnection>(*mgr_);
  auto holder4 = std::make_unique<PooledConnection>(*mgr_);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  // Request another connection on another thread, which should block until one is returned
  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(*mgr_);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, ShutdownRejectsBorrowers) {
  mgr_->shutdown();
  EXPECT_THROW(PooledConnection conn(*mgr_), std::runtime_error);
}

TEST(ConnectionPoolSizeTest, RejectsEmptyPool) {
  auto dir = rag_tests::TestUtilities::create_temp_dir("rag_pool_tests");
  EXPECT_THROW(ConnectionPool((dir / "x.db").string(), 0), std::invalid_argument);
  rag_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(ConnectionPoolSizeTest, RejectsNegativeBusyTimeout) {
  auto dir = rag_tests::TestUtilities::create_temp_dir("rag_pool_tests");
  EXPECT_THROW(ConnectionPool((dir / "x.db").string(), 1, -1), std::invalid_argument);
  rag_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(ConnectionPoolSizeTest, AppliesBusyTimeoutAndTracksIdleHandles) {
  auto dir = rag_tests::TestUtilities::create_temp_dir("rag_pool_tests");
  {
    ConnectionPool pool((dir / "x.db").string(), 2, 250);
    EXPECT_EQ(pool.idle_connections(), 2u);

    auto conn = pool.get_connection();
    EXPECT_EQ(pool.idle_connections(), 1u);
    int timeout = 0;
    *conn << "PRAGMA busy_timeout;" >> timeout;
    EXPECT_EQ(timeout, 250);

    pool.return_connection(std::move(conn));
    EXPECT_EQ(pool.idle_connections(), 2u);

    pool.shutdown();
    EXPECT_EQ(pool.idle_connections(), 0u);
  }
  rag_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST_F(ConnectionPoolTest, PooledConnectionReturnsHandleOnScopeExit) {
  {
    PooledConnection conn(*mgr_);
    PooledConnection other(*mgr_);
    int count = 0;
    *other << "SELECT COUNT(*) FROM sqlite_master" >> count;
  }
  // every handle is free again, so all four can be held at once
  PooledConnection c1(*mgr_);
  PooledConnection c2(*mgr_);
  PooledConnection c3(*mgr_);
  PooledConnection c4(*mgr_);
  SUCCEED();
}

TEST_F(ConnectionPoolTest, TransactionRollsBackUnlessCommitted) {
  PooledConnection conn(*mgr_);
  *conn << "CREATE TABLE scratch (value INTEGER);";

  {
    Transaction tx(*conn, /*immediate*/ true);
    EXPECT_TRUE(tx.active());
    *conn << "INSERT INTO scratch (value) VALUES (1);";
  }
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO scratch (value) VALUES (2);";
    tx.commit();
    EXPECT_FALSE(tx.active());
  }

  int total = 0;
  *conn << "SELECT COALESCE(SUM(value), 0) FROM scratch;" >> total;
  EXPECT_EQ(total, 2);
}

}  // namespace rag_core
