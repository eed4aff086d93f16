#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace rag_core {
struct TaskDTO;
class ServiceProvider;
}

namespace rag_core {
namespace async {

/**
 * @class Worker
 * @brief A background thread that claims tasks from the queue and runs them.
 *
 * Each cycle claims the next pending task, builds it with TaskFactory, runs it
 * and marks it completed or failed. When the queue is empty the worker sleeps
 * for the poll interval.
 *
 * Non-copyable and non-movable; the destructor stops and joins the thread.
 */
class Worker {
 public:
  Worker(int worker_id, std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2000));

  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread.
   * @throws std::runtime_error if the worker is already running.
   */
  void start();

  /**
   * @brief Asks the loop to exit after the current task. Does not block.
   */
  void stop();

  /**
   * @brief Runs one claim/execute cycle on the calling thread.
   * @return false if there was no pending task.
   */
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  void execute_task(const TaskDTO& task_dto);

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};
}  // namespace async
}  // namespace rag_core
