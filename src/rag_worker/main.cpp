#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "rag_core/app_context.hpp"
#include "rag_core/async/worker_pool.hpp"
#include "rag_core/config.hpp"
#include "rag_core/embeddings/embedder.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char* argv[]) {
  try {
    std::string config_path = argc > 1 ? argv[1] : "ragrc.json";
    rag_core::Config config = rag_core::Config::defaults();
    if (argc > 1 || std::filesystem::exists(config_path)) {
      config = rag_core::Config::from_file(config_path);
    } else {
      std::cerr << "Warning: " << config_path << " not found, using defaults" << std::endl;
    }

    std::cout << "Starting RAG ingestion worker..." << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Object Storage: " << config.object_storage_root << std::endl;
    std::cout << "Vector Store: " << config.vector_store_path << " (" << config.vector_backend
              << ")" << std::endl;
    std::cout << "Embedding Provider: " << config.embedding_provider << std::endl;
    std::cout << "Workers: " << config.num_workers << std::endl;

    rag_core::AppContext context(config);
    // Resolve the embedder up front so a fallback warning shows at startup
    std::cout << "Embedding Model: " << context.embedder().model_id() << std::endl;

    auto worker_pool = std::make_shared<rag_core::async::WorkerPool>(
        static_cast<size_t>(config.num_workers), context.services(),
        config.worker_poll_interval());

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    worker_pool->start();
    std::cout << "Worker pool started. Press Ctrl+C to exit." << std::endl;

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping worker pool to finish processing..." << std::endl;
    worker_pool.reset();  // Joins every worker

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    context.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting worker: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
