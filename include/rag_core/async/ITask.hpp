#pragma once

#include <memory>
#include <string>

#include "rag_core/db/models/task_dto.hpp"
#include "rag_core/types/progress.hpp"

namespace rag_core {

class ServiceProvider;

// A claimed queue row turned into runnable work. The worker records the
// outcome on the queue row; execute() throws to mark the task failed.
class ITask {
 public:
  explicit ITask(const TaskDTO& record)
      : id_(record.id), status_(record.status), target_id_(record.target_id) {}

  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const { return id_; }
  TaskStatus get_status() const { return status_; }
  const std::string& get_target_id() const { return target_id_; }

 protected:
  long long id_;
  TaskStatus status_;
  std::string target_id_;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace rag_core
