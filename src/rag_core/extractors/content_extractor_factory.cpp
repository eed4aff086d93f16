#include "rag_core/extractors/content_extractor_factory.hpp"

#include "rag_core/extractors/pdf_extractor.hpp"
#include "rag_core/extractors/plaintext_extractor.hpp"

namespace rag_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<PdfExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::string& mime_type, const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(mime_type, file_path)) {
      return *extractor;
    }
  }
  throw UnsupportedMimeTypeError(mime_type);
}
}  // namespace rag_core
