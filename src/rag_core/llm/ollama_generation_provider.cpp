#include "rag_core/llm/ollama_generation_provider.hpp"

#include "ollama.hpp"
#include "rag_core/llm/ollama_connection.hpp"

namespace rag_core {

namespace {

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

OllamaGenerationProvider::OllamaGenerationProvider(const std::string& ollama_url,
                                                   const std::string& model)
    : ollama_url_(ollama_url), model_(model) {
  lock_ollama_server(ollama_url_);
}

std::string OllamaGenerationProvider::generate(const std::string& system_prompt,
                                               const std::vector<ConversationTurn>& turns,
                                               const GenerationParams& params) {
  ollama::messages messages;
  if (!system_prompt.empty()) {
    messages.push_back(ollama::message("system", system_prompt));
  }
  for (const auto& turn : turns) {
    const char* role = turn.role == TurnRole::User ? "user" : "assistant";
    messages.push_back(ollama::message(role, turn.text));
  }

  ollama::options options;
  options["temperature"] = params.temperature;
  options["num_predict"] = params.max_output_tokens;

  const std::string& model = params.model.empty() ? model_ : params.model;
  std::string answer;
  try {
    auto lock = lock_ollama_server(ollama_url_);
    ollama::response response = ollama::chat(model, messages, options);
    answer = trim(response.as_simple_string());
  } catch (const ollama::exception& e) {
    throw GenerationError("Generation failed: " + std::string(e.what()));
  }

  if (answer.empty()) {
    throw GenerationError("Generation model " + model + " returned an empty answer");
  }
  return answer;
}

}  // namespace rag_core
