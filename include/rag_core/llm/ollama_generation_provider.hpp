#pragma once

#include <string>

#include "rag_core/llm/generation_provider.hpp"

namespace rag_core {

// Sends a chat request to an Ollama server. The server is not contacted at
// construction; an unreachable server surfaces as a GenerationError per call.
class OllamaGenerationProvider : public GenerationProvider {
 public:
  OllamaGenerationProvider(const std::string& ollama_url, const std::string& model);

  OllamaGenerationProvider(const OllamaGenerationProvider&) = delete;
  OllamaGenerationProvider& operator=(const OllamaGenerationProvider&) = delete;

  std::string generate(const std::string& system_prompt,
                       const std::vector<ConversationTurn>& turns,
                       const GenerationParams& params) override;

  const std::string& model() const { return model_; }

 private:
  std::string ollama_url_;
  std::string model_;
};

}  // namespace rag_core
