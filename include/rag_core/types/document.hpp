#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace rag_core {

// pending -> processing -> {ready | failed}; only the ingestion pipeline moves it past pending.
enum class DocumentStatus { Pending, Processing, Ready, Failed };

inline std::string to_string(DocumentStatus status) {
  switch (status) {
    case DocumentStatus::Pending:
      return "pending";
    case DocumentStatus::Processing:
      return "processing";
    case DocumentStatus::Ready:
      return "ready";
    case DocumentStatus::Failed:
      return "failed";
  }
  return "unknown";
}

inline DocumentStatus document_status_from_string(const std::string &str) {
  if (str == "pending")
    return DocumentStatus::Pending;
  if (str == "processing")
    return DocumentStatus::Processing;
  if (str == "ready")
    return DocumentStatus::Ready;
  if (str == "failed")
    return DocumentStatus::Failed;
  throw std::invalid_argument("Unknown DocumentStatus: " + str);
}

struct Document {
  std::string id;
  std::string chatbot_id;
  std::string file_name;
  std::string storage_key;
  std::string mime_type;
  int64_t size_bytes = 0;
  std::string checksum;
  DocumentStatus status = DocumentStatus::Pending;
  std::optional<std::string> error;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct ChatbotConfig {
  std::string id;
  std::string name;
  std::string system_prompt;
  std::string model_name;
  float temperature = 0.2f;
  int top_k = 4;
};

}  // namespace rag_core
