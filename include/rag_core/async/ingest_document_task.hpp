#pragma once

#include <string>

#include "rag_core/async/ITask.hpp"

namespace rag_core {
class IngestDocumentTask : public ITask {
 public:
  explicit IngestDocumentTask(const TaskDTO& record);

  // The ingestion outcome is recorded on the document, so this only throws
  // when the document itself is missing or unwritable.
  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override { return INGEST_DOCUMENT_TASK; }

  const std::string& get_document_id() const { return target_id_; }
};
}  // namespace rag_core
