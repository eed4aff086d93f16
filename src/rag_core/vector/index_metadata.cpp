#include "rag_core/vector/index_metadata.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

std::optional<IndexMetadata> read_index_metadata(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw VectorIndexError("Could not open index metadata: " + path.string());
  }

  try {
    nlohmann::json json;
    file >> json;

    IndexMetadata metadata;
    metadata.chunk_ids = json.at("chunk_ids").get<std::vector<std::string>>();
    const auto dimension = json.at("dimension").get<int64_t>();
    if (dimension < 0) {
      throw IndexCorruptionError("Negative dimension in " + path.string());
    }
    metadata.dimension = static_cast<size_t>(dimension);
    return metadata;
  } catch (const nlohmann::json::exception& e) {
    throw IndexCorruptionError("Invalid index metadata in " + path.string() + ": " + e.what());
  }
}

void write_index_metadata(const std::filesystem::path& path, const IndexMetadata& metadata) {
  nlohmann::json json;
  json["chunk_ids"] = metadata.chunk_ids;
  json["dimension"] = metadata.dimension;

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw VectorIndexError("Could not open " + path.string() + " for writing");
  }
  file << json.dump();
  file.flush();
  if (!file) {
    throw VectorIndexError("Failed writing " + path.string());
  }
}

}  // namespace rag_core
