#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/llm/generation_provider.hpp"
#include "rag_core/types/document.hpp"
#include "rag_core/vector/vector_index.hpp"

namespace rag_core {

class KnowledgeStore;
class Embedder;

// Rejected input; nothing was embedded or generated
class RagValidationError : public std::exception {
 public:
  explicit RagValidationError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Retrieval or generation failed after the input was accepted
class RagGenerationError : public std::exception {
 public:
  explicit RagGenerationError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetrievedChunk {
  std::string chunk_id;
  std::string document_id;
  std::string document_name;
  float score = 0.0f;
  std::string content;
};

struct RagResponse {
  std::string answer;
  // In search rank order
  std::vector<RetrievedChunk> context;
};

// A prior message as stored by the chat layer; role is free text ("user", "assistant", ...)
struct HistoryTurn {
  std::string role;
  std::string content;
};

struct RetrievalOptions {
  // Used when neither the caller nor the chatbot gives a positive top_k
  int default_top_k = 4;
  int max_output_tokens = 1024;
  VectorIndexOptions vector_index;
};

/**
 * @class RagService
 * @brief Answers a chat message from a chatbot's own knowledge base.
 *
 * respond() embeds the message, searches the chatbot's vector index, loads the
 * matching chunks in rank order, and asks the generation provider to answer
 * using them as context. Empty messages raise RagValidationError before any
 * other work; every later failure is raised as RagGenerationError.
 */
class RagService {
 public:
  static constexpr const char* DEFAULT_BEHAVIOR_PROMPT =
      "You are a helpful assistant that answers questions using the provided context from the "
      "user's knowledge base. If the context does not contain the answer, politely explain that "
      "the information is unavailable.";
  static constexpr const char* EMPTY_CONTEXT_TEXT =
      "No relevant context was retrieved from the knowledge base.";
  static constexpr const char* ANSWER_INSTRUCTIONS =
      "Use the provided context snippets to answer the user's latest question. If the context is "
      "empty or insufficient, clearly state that the answer is not available.";

  RagService(KnowledgeStore& store, Embedder& embedder, GenerationProvider& provider,
             RetrievalOptions options);

  RagService(const RagService&) = delete;
  RagService& operator=(const RagService&) = delete;

  RagResponse respond(const ChatbotConfig& chatbot, const std::string& message,
                      const std::vector<HistoryTurn>& history,
                      std::optional<int> top_k = std::nullopt);

  // Search without generation. Throws the underlying component errors.
  std::vector<RetrievedChunk> retrieve(const ChatbotConfig& chatbot, const std::string& query,
                                       int top_k);

  int effective_top_k(const ChatbotConfig& chatbot, std::optional<int> top_k) const;

  static std::string compose_system_prompt(const ChatbotConfig& chatbot);
  static std::string build_context_block(const std::vector<RetrievedChunk>& chunks);
  static std::string compose_user_turn(const std::string& context_block,
                                       const std::string& message);
  // user -> User, assistant/model -> Model (any case); other roles are dropped
  static std::vector<ConversationTurn> normalize_history(const std::vector<HistoryTurn>& history);

 private:
  KnowledgeStore& store_;
  Embedder& embedder_;
  GenerationProvider& provider_;
  RetrievalOptions options_;
};

}  // namespace rag_core
