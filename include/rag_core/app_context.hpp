#pragma once

#include <memory>

#include "rag_core/config.hpp"

namespace rag_core {

class DatabaseManager;
class KnowledgeStore;
class TaskQueueRepo;
class ObjectStorage;
class ContentExtractorFactory;
class Embedder;
class GenerationProvider;
class IngestionService;
class DocumentService;
class RagService;
class ServiceProvider;

/**
 * @class AppContext
 * @brief Builds and owns the components of one process from a Config.
 *
 * The database and storage are opened at construction. The embedder and the
 * generation provider are created on first use, so commands that never embed
 * do not contact the model server. Not thread-safe; resolve everything a worker
 * pool needs before starting it.
 */
class AppContext {
 public:
  explicit AppContext(const Config& config);
  ~AppContext();

  AppContext(const AppContext&) = delete;
  AppContext& operator=(const AppContext&) = delete;

  const Config& config() const { return config_; }

  DatabaseManager& database();
  KnowledgeStore& store();
  TaskQueueRepo& tasks();
  ObjectStorage& storage();
  Embedder& embedder();
  GenerationProvider& generation();
  IngestionService& ingestion();
  DocumentService& documents();
  RagService& rag();
  std::shared_ptr<ServiceProvider> services();

  void shutdown();

 private:
  Config config_;
  std::shared_ptr<DatabaseManager> db_manager_;
  std::shared_ptr<KnowledgeStore> store_;
  std::shared_ptr<TaskQueueRepo> tasks_;
  std::shared_ptr<ObjectStorage> storage_;
  std::shared_ptr<ContentExtractorFactory> extractors_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<GenerationProvider> generation_;
  std::shared_ptr<IngestionService> ingestion_;
  std::shared_ptr<DocumentService> documents_;
  std::shared_ptr<RagService> rag_;
  std::shared_ptr<ServiceProvider> services_;
};

}  // namespace rag_core
