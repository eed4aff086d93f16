#pragma once

#include "rag_core/async/ITask.hpp"

namespace rag_core {
class TaskFactory {
 public:
  // Throws std::runtime_error for unknown task types or missing arguments
  static ITaskPtr create_task(const TaskDTO& record);
};
}  // namespace rag_core
