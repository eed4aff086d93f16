#include "rag_core/async/ingest_document_task.hpp"

#include "rag_core/async/service_provider.hpp"
#include "rag_core/services/ingestion_service.hpp"

namespace rag_core {

IngestDocumentTask::IngestDocumentTask(const TaskDTO& record) : ITask(record) {}

void IngestDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  services.get_ingestion_service().ingest(target_id_, on_progress);
}

}  // namespace rag_core
