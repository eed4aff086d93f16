#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace rag_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when no extractor accepts a document's MIME type.
class UnsupportedMimeTypeError : public ContentExtractorError {
 public:
  explicit UnsupportedMimeTypeError(const std::string& mime_type)
      : ContentExtractorError("Unsupported file type for ingestion: " + mime_type) {}
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given MIME type / file name
  virtual bool can_handle(const std::string& mime_type, const fs::path& file_path) const = 0;

  // Reads the whole file and returns its text. An empty string means "no text found".
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual const char* name() const = 0;

 protected:
  std::string get_string_content(const fs::path& file_path) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace rag_core
