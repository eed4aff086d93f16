#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rag_core/embeddings/embedder.hpp"

namespace rag_core {

// One raw embedding request against a model server
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;
  virtual std::vector<float> request(const std::string& model, const std::string& text) = 0;
};

class OllamaEmbeddingClient : public EmbeddingClient {
 public:
  // Throws EmbedderError if the server is not running at ollama_url
  explicit OllamaEmbeddingClient(const std::string& ollama_url);

  std::vector<float> request(const std::string& model, const std::string& text) override;

 private:
  std::string ollama_url_;
};

// Safe to share between worker threads: requests are issued one at a time and
// the dimension learned from the first response is fixed afterwards.
class OllamaEmbedder : public Embedder {
 public:
  // Throws EmbedderError if the server is not running at ollama_url
  OllamaEmbedder(const std::string& ollama_url, const std::string& model, bool normalize);
  OllamaEmbedder(std::unique_ptr<EmbeddingClient> client, const std::string& model,
                 bool normalize);
  ~OllamaEmbedder() override = default;

  // Disable copy constructor and assignment
  OllamaEmbedder(const OllamaEmbedder&) = delete;
  OllamaEmbedder& operator=(const OllamaEmbedder&) = delete;

  std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override;
  std::vector<float> embed_one(const std::string& text) override;

  size_t dimension() const override { return dimension_.load(); }
  std::string model_id() const override { return model_; }
  bool is_semantic() const override { return true; }

  static bool is_server_available(const std::string& ollama_url);

 private:
  std::unique_ptr<EmbeddingClient> client_;
  std::string model_;
  bool normalize_;
  std::mutex request_mutex_;
  std::atomic<size_t> dimension_{0};

  // Caller holds request_mutex_
  void check_dimension(const std::vector<float>& vector);
};

}  // namespace rag_core
