#include "rag_core/llm/ollama_connection.hpp"

#include "ollama.hpp"

namespace rag_core {

namespace {

std::mutex& server_mutex() {
  static std::mutex mutex;
  return mutex;
}

// Guarded by server_mutex()
std::string& current_server_url() {
  static std::string url;
  return url;
}

}  // namespace

std::unique_lock<std::mutex> lock_ollama_server(const std::string& ollama_url) {
  std::unique_lock<std::mutex> lock(server_mutex());
  if (current_server_url() != ollama_url) {
    ollama::setServerURL(ollama_url);
    current_server_url() = ollama_url;
  }
  return lock;
}

}  // namespace rag_core
