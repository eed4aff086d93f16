#include "rag_core/services/document_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>

#include "rag_core/db/knowledge_store.hpp"
#include "rag_core/db/task_queue_repo.hpp"
#include "rag_core/services/hash_service.hpp"
#include "rag_core/storage/object_storage.hpp"
#include "rag_core/types/uuid.hpp"

namespace rag_core {

DocumentService::DocumentService(KnowledgeStore& store, TaskQueueRepo& tasks,
                                 ObjectStorage& storage)
    : store_(store), tasks_(tasks), storage_(storage) {}

Document DocumentService::register_upload(const std::string& chatbot_id,
                                          const std::string& file_name,
                                          const std::string& mime_type, std::string_view bytes) {
  if (!store_.get_chatbot(chatbot_id)) {
    throw DocumentServiceError("Chatbot not found: " + chatbot_id);
  }
  if (bytes.empty()) {
    throw DocumentServiceError("Uploaded file is empty");
  }
  const std::string base_name = std::filesystem::path(file_name).filename().string();
  if (base_name.empty() || base_name == "." || base_name == "..") {
    throw DocumentServiceError("Invalid file name: '" + file_name + "'");
  }

  Document document;
  document.id = generate_uuid();
  document.chatbot_id = chatbot_id;
  document.file_name = base_name;
  document.storage_key = "chatbots/" + chatbot_id + "/" + document.id + "/" + base_name;
  document.mime_type = mime_type.empty() ? guess_mime_type(base_name) : mime_type;
  document.size_bytes = static_cast<int64_t>(bytes.size());
  document.checksum = HashService::sha256_hex(bytes);
  document.status = DocumentStatus::Pending;
  document.created_at = std::chrono::system_clock::now();
  document.updated_at = document.created_at;

  storage_.put(document.storage_key, bytes);
  store_.create_document(document);

  try {
    tasks_.enqueue_ingest_document(document.id);
  } catch (const TaskQueueRepoError& e) {
    store_.update_document_status(document.id, DocumentStatus::Failed,
                                  std::string("Could not schedule ingestion: ") + e.what());
    throw DocumentServiceError(std::string("Could not schedule ingestion: ") + e.what());
  }

  std::cout << "[Upload] Registered document " << document.id << " (" << base_name << ", "
            << document.size_bytes << " bytes) for chatbot " << chatbot_id << std::endl;
  return document;
}

std::string DocumentService::guess_mime_type(const std::filesystem::path& file_path) {
  static const std::unordered_map<std::string, std::string> by_extension = {
      {".pdf", "application/pdf"}, {".txt", "text/plain"},     {".text", "text/plain"},
      {".log", "text/plain"},      {".md", "text/markdown"},   {".markdown", "text/markdown"},
      {".csv", "text/csv"},        {".tsv", "text/tab-separated-values"},
      {".html", "text/html"},      {".htm", "text/html"},      {".xml", "text/xml"},
      {".json", "application/json"},
  };

  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = by_extension.find(extension);
  return it == by_extension.end() ? "application/octet-stream" : it->second;
}

}  // namespace rag_core
