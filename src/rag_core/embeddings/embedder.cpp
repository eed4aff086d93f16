#include "rag_core/embeddings/embedder.hpp"

#include <iostream>

#include "rag_core/embeddings/hash_embedder.hpp"
#include "rag_core/embeddings/ollama_embedder.hpp"

namespace rag_core {

namespace {

std::unique_ptr<Embedder> make_placeholder(const EmbedderOptions& options) {
  std::cout << "[Embedder] Using deterministic placeholder embeddings ("
            << HashEmbedder::MODEL_ID << ", " << options.fallback_dimension
            << " dims). Search results are NOT semantic." << std::endl;
  return std::make_unique<HashEmbedder>(options.fallback_dimension);
}

}  // namespace

std::unique_ptr<Embedder> make_embedder(const EmbedderOptions& options) {
  if (options.provider == "hash") {
    return make_placeholder(options);
  }
  if (options.provider != "ollama") {
    throw EmbedderError("Unknown embedding provider: " + options.provider);
  }

  if (OllamaEmbedder::is_server_available(options.ollama_url)) {
    return std::make_unique<OllamaEmbedder>(options.ollama_url, options.model, options.normalize);
  }
  if (!options.allow_fallback) {
    throw EmbedderError("Ollama server is not running at " + options.ollama_url);
  }
  std::cerr << "Warning: Ollama server is not reachable at " << options.ollama_url
            << ", falling back to placeholder embeddings" << std::endl;
  return make_placeholder(options);
}

}  // namespace rag_core
