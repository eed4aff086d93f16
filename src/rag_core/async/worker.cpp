#include "rag_core/async/worker.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

#include "rag_core/async/ITask.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/task_factory.hpp"
#include "rag_core/db/models/task_dto.hpp"
#include "rag_core/db/task_queue_repo.hpp"

namespace rag_core {
namespace async {

Worker::Worker(int worker_id, std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  if (!services_) {
    throw std::invalid_argument("Worker requires a ServiceProvider");
  }
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  // RAII: never let the thread outlive the worker
  if (thread.joinable()) {
    thread.join();
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;

  while (!should_stop.load()) {
    bool did_work = false;
    try {
      did_work = run_one_task();
    } catch (const std::exception& e) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling task queue: " << e.what()
                << std::endl;
    }
    if (!did_work) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  std::optional<TaskDTO> task_dto = services_->get_task_queue_repo().fetch_and_claim_next_task();
  if (!task_dto) {
    return false;
  }
  std::cout << "Worker [" << worker_id_ << "] claimed task " << task_dto->id << std::endl;
  execute_task(*task_dto);
  return true;
}

void Worker::execute_task(const TaskDTO& task_dto) {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  try {
    ITaskPtr task = TaskFactory::create_task(task_dto);

    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      task_repo.upsert_task_progress(task_dto.id, p, msg);
    };

    std::cout << "Worker [" << worker_id_ << "] running " << task->get_type() << " for "
              << task->get_target_id() << std::endl;
    task->execute(*services_, on_progress);
    task_repo.update_task_status(task_dto.id, TaskStatus::COMPLETED);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << task_dto.id << ": "
              << e.what() << std::endl;
    task_repo.mark_task_as_failed(task_dto.id, e.what());
  }
}
}  // namespace async
}  // namespace rag_core
