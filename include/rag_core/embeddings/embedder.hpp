#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rag_core {

class EmbedderError : public std::exception {
 public:
  explicit EmbedderError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct EmbedderOptions {
  std::string provider = "ollama";  // "ollama" or "hash"
  bool allow_fallback = true;
  std::string ollama_url = "http://localhost:11434";
  std::string model = "all-minilm";
  bool normalize = true;
  size_t fallback_dimension = 48;
};

// Maps text to fixed-width vectors. One instance always produces vectors of a
// single width.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) = 0;
  virtual std::vector<float> embed_one(const std::string& text) = 0;

  // Width of the produced vectors, 0 while not yet known
  virtual size_t dimension() const = 0;

  // Identifier persisted next to every embedding row
  virtual std::string model_id() const = 0;

  // false for placeholder vectors that carry no meaning
  virtual bool is_semantic() const = 0;
};

/**
 * @brief Builds the embedder described by the options.
 *
 * The choice is made once here. With provider "ollama" the model server is
 * checked; if it does not answer and fallback is allowed, a HashEmbedder is
 * returned instead and a warning is logged.
 *
 * @throw EmbedderError for an unknown provider, or an unreachable server
 *        with fallback disabled.
 */
std::unique_ptr<Embedder> make_embedder(const EmbedderOptions& options);

}  // namespace rag_core
