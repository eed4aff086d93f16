#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "rag_core/types/document.hpp"

namespace rag_core {

class KnowledgeStore;
class TaskQueueRepo;
class ObjectStorage;

class DocumentServiceError : public std::exception {
 public:
  explicit DocumentServiceError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocumentService {
 public:
  DocumentService(KnowledgeStore& store, TaskQueueRepo& tasks, ObjectStorage& storage);

  /**
   * @brief Stores an uploaded file and schedules its ingestion.
   *
   * The bytes go to chatbots/<chatbot_id>/<uuid>/<basename>, the document is
   * created as pending with its SHA-256 checksum, and one INGEST_DOCUMENT task
   * is enqueued for it.
   *
   * @throw DocumentServiceError for an unknown chatbot, an empty file or an unusable name.
   */
  Document register_upload(const std::string& chatbot_id, const std::string& file_name,
                           const std::string& mime_type, std::string_view bytes);

  // Best-effort MIME type from the file extension; application/octet-stream when unknown
  static std::string guess_mime_type(const std::filesystem::path& file_path);

 private:
  KnowledgeStore& store_;
  TaskQueueRepo& tasks_;
  ObjectStorage& storage_;
};

}  // namespace rag_core
