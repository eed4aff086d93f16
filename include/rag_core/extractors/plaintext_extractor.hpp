#pragma once

#include "content_extractor.hpp"

namespace rag_core {

// Any text/* document. Bytes that are not valid UTF-8 are dropped.
class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::string& mime_type, const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  const char* name() const override { return "plaintext"; }

  static std::string strip_invalid_utf8(const std::string& content);
};

}  // namespace rag_core
