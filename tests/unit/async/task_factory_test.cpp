#include <gtest/gtest.h>

#include "rag_core/async/ingest_document_task.hpp"
#include "rag_core/async/task_factory.hpp"

namespace rag_core {

TEST(TaskFactoryTest, BuildsIngestDocumentTask) {
  TaskDTO record;
  record.id = 7;
  record.task_type = INGEST_DOCUMENT_TASK;
  record.target_id = "doc-1";
  record.status = TaskStatus::PROCESSING;

  ITaskPtr task = TaskFactory::create_task(record);

  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->get_id(), 7);
  EXPECT_STREQ(task->get_type(), INGEST_DOCUMENT_TASK);
  EXPECT_EQ(task->get_status(), TaskStatus::PROCESSING);
  auto* ingest = dynamic_cast<IngestDocumentTask*>(task.get());
  ASSERT_NE(ingest, nullptr);
  EXPECT_EQ(ingest->get_document_id(), "doc-1");
  EXPECT_EQ(task->get_target_id(), "doc-1");
}

TEST(TaskFactoryTest, IngestWithoutDocumentIdThrows) {
  TaskDTO record;
  record.task_type = INGEST_DOCUMENT_TASK;
  EXPECT_THROW(TaskFactory::create_task(record), std::runtime_error);
}

TEST(TaskFactoryTest, UnknownTypeThrows) {
  TaskDTO record;
  record.task_type = "SUMMARIZE";
  record.target_id = "x";
  EXPECT_THROW(TaskFactory::create_task(record), std::runtime_error);
}

}  // namespace rag_core
