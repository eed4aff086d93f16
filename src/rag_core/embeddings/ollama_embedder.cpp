#include "rag_core/embeddings/ollama_embedder.hpp"

#include <cmath>

#include "ollama.hpp"
#include "rag_core/llm/ollama_connection.hpp"

namespace rag_core {

OllamaEmbeddingClient::OllamaEmbeddingClient(const std::string& ollama_url)
    : ollama_url_(ollama_url) {
  if (!OllamaEmbedder::is_server_available(ollama_url_)) {
    throw EmbedderError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaEmbeddingClient::request(const std::string& model,
                                                  const std::string& text) {
  try {
    auto lock = lock_ollama_server(ollama_url_);
    ollama::response response = ollama::generate_embeddings(model, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbedderError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbedderError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception& e) {
    throw EmbedderError("Embedding generation failed: " + std::string(e.what()));
  }
}

OllamaEmbedder::OllamaEmbedder(const std::string& ollama_url, const std::string& model,
                               bool normalize)
    : OllamaEmbedder(std::make_unique<OllamaEmbeddingClient>(ollama_url), model, normalize) {}

OllamaEmbedder::OllamaEmbedder(std::unique_ptr<EmbeddingClient> client, const std::string& model,
                               bool normalize)
    : client_(std::move(client)), model_(model), normalize_(normalize) {
  if (!client_) {
    throw EmbedderError("OllamaEmbedder requires an embedding client");
  }
}

bool OllamaEmbedder::is_server_available(const std::string& ollama_url) {
  try {
    auto lock = lock_ollama_server(ollama_url);
    return ollama::is_running();
  } catch (const ollama::exception&) {
    return false;
  }
}

std::vector<std::vector<float>> OllamaEmbedder::embed_many(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

std::vector<float> OllamaEmbedder::embed_one(const std::string& text) {
  std::vector<float> vector;
  {
    std::lock_guard<std::mutex> lock(request_mutex_);
    vector = client_->request(model_, text);
    if (vector.empty()) {
      throw EmbedderError("Embedding model " + model_ + " returned an empty vector");
    }
    check_dimension(vector);
  }

  if (normalize_) {
    double norm = 0.0;
    for (float v : vector) {
      norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
      for (float& v : vector) {
        v = static_cast<float>(v / norm);
      }
    }
  }
  return vector;
}

void OllamaEmbedder::check_dimension(const std::vector<float>& vector) {
  const size_t expected = dimension_.load();
  if (expected == 0) {
    dimension_.store(vector.size());
    return;
  }
  if (vector.size() != expected) {
    throw EmbedderError("Embedding model " + model_ + " returned " +
                        std::to_string(vector.size()) + " dimensions, expected " +
                        std::to_string(expected));
  }
}

}  // namespace rag_core
