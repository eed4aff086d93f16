#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "rag_core/async/worker.hpp"

namespace rag_core::async {

/**
 * @class WorkerPool
 * @brief Owns a fixed set of Worker threads sharing one ServiceProvider.
 *
 * Workers may process documents of the same chatbot at the same time; the
 * vector index serializes their writes.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of workers, at least one.
   * @param services Shared by every worker.
   * @param poll_interval Idle sleep between queue polls.
   */
  WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2000));

  // Stops and joins all workers
  ~WorkerPool();

  void start();

  // Signals every worker to stop; does not block
  void stop();

  size_t size() const { return m_workers.size(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace rag_core::async
