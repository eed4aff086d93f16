#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace rag_core {

// Scoped SQLite transaction, rolled back unless commit() is reached.
// `immediate` takes the write lock at BEGIN; the chunk writes and the task
// claim use it so two writers never both upgrade from a read lock.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, bool immediate = false) : db_(db) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    active_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!active_) {
      return;
    }
    db_ << "COMMIT;";
    active_ = false;
  }

  bool active() const { return active_; }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: Could not roll back transaction: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool active_ = false;
};

}  // namespace rag_core
