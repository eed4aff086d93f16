#pragma once

#include "content_extractor.hpp"

namespace rag_core {

/**
 * @class PdfExtractor
 * @brief Extracts text from PDF documents page by page using poppler-cpp.
 *
 * A page that cannot be loaded or read is logged and skipped; the text of the
 * remaining pages is joined with newlines. Only a document that cannot be
 * opened at all is an error.
 */
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::string& mime_type, const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  const char* name() const override { return "pdf"; }
};

}  // namespace rag_core
