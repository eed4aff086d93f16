#include "rag_core/async/task_factory.hpp"

#include <stdexcept>

#include "rag_core/async/ingest_document_task.hpp"

namespace rag_core {
ITaskPtr TaskFactory::create_task(const TaskDTO& record) {
  if (record.task_type == INGEST_DOCUMENT_TASK) {
    if (record.target_id.empty()) {
      throw std::runtime_error("INGEST_DOCUMENT task is missing its document id.");
    }
    return std::make_unique<IngestDocumentTask>(record);
  }

  throw std::runtime_error("Unknown task type: " + record.task_type);
}
}  // namespace rag_core
