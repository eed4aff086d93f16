#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace rag_core {

// Fixed set of SQLite handles to the knowledge database, opened up front with
// foreign keys on and a busy timeout so concurrent workers wait on each other
// instead of failing with SQLITE_BUSY.
class ConnectionPool {
 public:
  static constexpr int DEFAULT_BUSY_TIMEOUT_MS = 5000;

  ConnectionPool(const std::string& db_path, int pool_size,
                 int busy_timeout_ms = DEFAULT_BUSY_TIMEOUT_MS);

  // Blocks until a handle is free; throws std::runtime_error after shutdown()
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  size_t idle_connections() const;

 private:
  std::string db_path_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace rag_core
