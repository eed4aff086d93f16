#include "rag_core/extractors/content_extractor.hpp"

#include <fstream>
#include <sstream>

namespace rag_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentExtractorError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

}  // namespace rag_core
