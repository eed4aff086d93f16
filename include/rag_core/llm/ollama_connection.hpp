#pragma once

#include <mutex>
#include <string>

namespace rag_core {

// ollama-hpp routes every request through one process-wide client. Callers
// hold the returned lock for the whole request; it also points the shared
// client at ollama_url when another component last used a different server.
std::unique_lock<std::mutex> lock_ollama_server(const std::string& ollama_url);

}  // namespace rag_core
