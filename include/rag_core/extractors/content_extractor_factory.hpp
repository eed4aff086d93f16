#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

namespace rag_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor for a document from its MIME type.
 *
 * PDF is checked before plain text so that a PDF uploaded with a generic
 * MIME type but a .pdf name still goes through the PDF extractor.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Returns the first registered extractor that accepts the document.
   *
   * @param mime_type MIME type recorded at upload.
   * @param file_path Local path of the staged bytes (its extension is consulted).
   * @throw UnsupportedMimeTypeError if no extractor accepts the document.
   */
  virtual const ContentExtractor& get_extractor_for(const std::string& mime_type,
                                                    const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace rag_core
