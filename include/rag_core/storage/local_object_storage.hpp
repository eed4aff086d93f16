#pragma once

#include <filesystem>

#include "rag_core/storage/object_storage.hpp"

namespace rag_core {

// ObjectStorage over a directory. Keys are relative paths below the root;
// absolute keys and keys containing ".." are rejected.
class LocalObjectStorage : public ObjectStorage {
 public:
  explicit LocalObjectStorage(const std::filesystem::path& root);

  void put(const std::string& key, std::string_view bytes) override;
  void download(const std::string& key, const std::filesystem::path& destination) override;
  bool exists(const std::string& key) override;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path root_;

  std::filesystem::path resolve(const std::string& key) const;
};

}  // namespace rag_core
