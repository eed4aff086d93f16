#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rag_core {

// The <chatbot_id>.json artifact shared by both backends:
// {"chunk_ids": [...], "dimension": n}
struct IndexMetadata {
  std::vector<std::string> chunk_ids;
  size_t dimension = 0;
};

// std::nullopt when the file does not exist; IndexCorruptionError when it is unreadable
std::optional<IndexMetadata> read_index_metadata(const std::filesystem::path& path);

void write_index_metadata(const std::filesystem::path& path, const IndexMetadata& metadata);

}  // namespace rag_core
