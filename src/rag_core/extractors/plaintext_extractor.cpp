#include "rag_core/extractors/plaintext_extractor.hpp"

#include <utf8.h>

namespace rag_core {

bool PlainTextExtractor::can_handle(const std::string& mime_type,
                                    const fs::path& /*file_path*/) const {
  return mime_type.rfind("text/", 0) == 0;
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  return strip_invalid_utf8(get_string_content(file_path));
}

std::string PlainTextExtractor::strip_invalid_utf8(const std::string& content) {
  std::string cleaned;
  cleaned.reserve(content.size());

  auto it = content.begin();
  while (it != content.end()) {
    auto invalid = utf8::find_invalid(it, content.end());
    cleaned.append(it, invalid);
    if (invalid == content.end()) {
      break;
    }
    // skip the offending byte and resync on the next one
    it = invalid + 1;
  }
  return cleaned;
}

}  // namespace rag_core
