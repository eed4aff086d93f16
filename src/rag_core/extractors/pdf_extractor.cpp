#include "rag_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

namespace rag_core {

bool PdfExtractor::can_handle(const std::string& mime_type, const fs::path& file_path) const {
  if (mime_type == "application/pdf") {
    return true;
  }
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".pdf";
}

std::string PdfExtractor::extract_text(const fs::path& file_path) const {
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Failed to open PDF: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is encrypted: " + file_path.string());
  }

  std::vector<std::string> page_texts;
  const int page_count = doc->pages();
  for (int i = 0; i < page_count; ++i) {
    try {
      std::unique_ptr<poppler::page> page(doc->create_page(i));
      if (!page) {
        std::cerr << "Warning: Skipping unreadable PDF page " << i + 1 << " of "
                  << file_path.filename() << std::endl;
        continue;
      }
      poppler::byte_array utf8 = page->text().to_utf8();
      std::string text(utf8.begin(), utf8.end());
      if (!text.empty()) {
        page_texts.push_back(std::move(text));
      }
    } catch (const std::exception& e) {
      std::cerr << "Warning: Failed to extract text from PDF page " << i + 1 << " of "
                << file_path.filename() << ": " << e.what() << std::endl;
    }
  }

  std::string joined;
  for (const auto& text : page_texts) {
    if (!joined.empty()) {
      joined += '\n';
    }
    joined += text;
  }
  return joined;
}

}  // namespace rag_core
