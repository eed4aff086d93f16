#pragma once

#include <filesystem>

namespace rag_core {

enum class LockMode { Shared, Exclusive };

/**
 * @class FileLock
 * @brief Blocking advisory lock on a whole file, released on destruction.
 *
 * Uses open file description locks, so two FileLocks in one process conflict
 * the same way locks held by two processes do. The file is created if needed.
 */
class FileLock {
 public:
  FileLock(const std::filesystem::path& path, LockMode mode);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

 private:
  int fd_ = -1;
};

}  // namespace rag_core
