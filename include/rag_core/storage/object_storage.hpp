#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rag_core {

class ObjectStorageError : public std::exception {
 public:
  explicit ObjectStorageError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Byte storage for uploaded originals, addressed by relative keys.
class ObjectStorage {
 public:
  virtual ~ObjectStorage() = default;

  virtual void put(const std::string& key, std::string_view bytes) = 0;

  // Copies the object byte-for-byte to destination
  virtual void download(const std::string& key, const std::filesystem::path& destination) = 0;

  virtual bool exists(const std::string& key) = 0;
};

}  // namespace rag_core
