#pragma once

#include <memory>

namespace rag_core {
class KnowledgeStore;
class TaskQueueRepo;
class IngestionService;
}

namespace rag_core {

// What a task may use while it runs
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<KnowledgeStore> store,
                  std::shared_ptr<TaskQueueRepo> repo,
                  std::shared_ptr<IngestionService> ingestion)
      : store_(std::move(store)), task_repo_(std::move(repo)), ingestion_(std::move(ingestion)) {}

  KnowledgeStore& get_knowledge_store() {
    return *store_;
  }
  TaskQueueRepo& get_task_queue_repo() {
    return *task_repo_;
  }
  IngestionService& get_ingestion_service() {
    return *ingestion_;
  }

 private:
  std::shared_ptr<KnowledgeStore> store_;
  std::shared_ptr<TaskQueueRepo> task_repo_;
  std::shared_ptr<IngestionService> ingestion_;
};

}  // namespace rag_core
