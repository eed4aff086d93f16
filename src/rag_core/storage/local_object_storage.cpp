#include "rag_core/storage/local_object_storage.hpp"

#include <fstream>
#include <system_error>

namespace rag_core {

LocalObjectStorage::LocalObjectStorage(const std::filesystem::path& root) : root_(root) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw ObjectStorageError("Could not create object storage root " + root_.string() + ": " +
                             ec.message());
  }
}

std::filesystem::path LocalObjectStorage::resolve(const std::string& key) const {
  if (key.empty()) {
    throw ObjectStorageError("Empty storage key");
  }
  const std::filesystem::path relative(key);
  if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
    throw ObjectStorageError("Storage key must be relative: " + key);
  }
  for (const auto& part : relative) {
    if (part == "..") {
      throw ObjectStorageError("Storage key must not contain '..': " + key);
    }
  }
  return root_ / relative;
}

void LocalObjectStorage::put(const std::string& key, std::string_view bytes) {
  const auto target = resolve(key);
  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    throw ObjectStorageError("Could not create directory for " + key + ": " + ec.message());
  }

  const std::filesystem::path tmp = target.string() + ".part";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ObjectStorageError("Could not open " + tmp.string() + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw ObjectStorageError("Failed writing object " + key);
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw ObjectStorageError("Could not store object " + key);
  }
}

void LocalObjectStorage::download(const std::string& key,
                                  const std::filesystem::path& destination) {
  const auto source = resolve(key);
  if (!std::filesystem::is_regular_file(source)) {
    throw ObjectStorageError("Object not found: " + key);
  }

  std::error_code ec;
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path(), ec);
  }
  std::filesystem::copy_file(source, destination,
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw ObjectStorageError("Could not download object " + key + ": " + ec.message());
  }
}

bool LocalObjectStorage::exists(const std::string& key) {
  return std::filesystem::is_regular_file(resolve(key));
}

}  // namespace rag_core
