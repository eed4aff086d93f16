#include "rag_core/vector/file_lock.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

FileLock::FileLock(const std::filesystem::path& path, LockMode mode) {
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw VectorIndexError("Could not open lock file " + path.string() + ": " +
                           std::strerror(errno));
  }

  struct flock fl{};
  fl.l_type = mode == LockMode::Exclusive ? F_WRLCK : F_RDLCK;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;  // whole file
  while (::fcntl(fd_, F_OFD_SETLKW, &fl) == -1) {
    if (errno == EINTR) {
      continue;
    }
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw VectorIndexError("Could not lock " + path.string() + ": " + std::strerror(err));
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    // closing the last descriptor of the description drops the lock
    ::close(fd_);
  }
}

}  // namespace rag_core
