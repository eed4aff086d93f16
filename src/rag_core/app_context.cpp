#include "rag_core/app_context.hpp"

#include "rag_core/async/service_provider.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/knowledge_store.hpp"
#include "rag_core/db/task_queue_repo.hpp"
#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/extractors/content_extractor_factory.hpp"
#include "rag_core/llm/ollama_generation_provider.hpp"
#include "rag_core/services/document_service.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/rag_service.hpp"
#include "rag_core/storage/local_object_storage.hpp"

namespace rag_core {

AppContext::AppContext(const Config& config) : config_(config) {
  db_manager_ = std::make_shared<DatabaseManager>(config_.database_path, config_.num_workers);
  store_ = std::make_shared<KnowledgeStore>(*db_manager_);
  tasks_ = std::make_shared<TaskQueueRepo>(*db_manager_);
  storage_ = std::make_shared<LocalObjectStorage>(config_.object_storage_root);
  extractors_ = std::make_shared<ContentExtractorFactory>();
}

AppContext::~AppContext() {
  shutdown();
}

DatabaseManager& AppContext::database() {
  return *db_manager_;
}

KnowledgeStore& AppContext::store() {
  return *store_;
}

TaskQueueRepo& AppContext::tasks() {
  return *tasks_;
}

ObjectStorage& AppContext::storage() {
  return *storage_;
}

Embedder& AppContext::embedder() {
  if (!embedder_) {
    embedder_ = make_embedder(config_.embedder_options());
  }
  return *embedder_;
}

GenerationProvider& AppContext::generation() {
  if (!generation_) {
    generation_ =
        std::make_shared<OllamaGenerationProvider>(config_.ollama_url, config_.generation_model);
  }
  return *generation_;
}

IngestionService& AppContext::ingestion() {
  if (!ingestion_) {
    ingestion_ = std::make_shared<IngestionService>(*store_, *storage_, *extractors_, embedder(),
                                                    config_.ingestion_options());
  }
  return *ingestion_;
}

DocumentService& AppContext::documents() {
  if (!documents_) {
    documents_ = std::make_shared<DocumentService>(*store_, *tasks_, *storage_);
  }
  return *documents_;
}

RagService& AppContext::rag() {
  if (!rag_) {
    rag_ = std::make_shared<RagService>(*store_, embedder(), generation(),
                                        config_.retrieval_options());
  }
  return *rag_;
}

std::shared_ptr<ServiceProvider> AppContext::services() {
  if (!services_) {
    ingestion();
    services_ = std::make_shared<ServiceProvider>(store_, tasks_, ingestion_);
  }
  return services_;
}

void AppContext::shutdown() {
  if (db_manager_) {
    db_manager_->shutdown();
  }
}

}  // namespace rag_core
