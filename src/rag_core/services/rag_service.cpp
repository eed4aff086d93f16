#include "rag_core/services/rag_service.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "rag_core/db/knowledge_store.hpp"
#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/types/uuid.hpp"

namespace rag_core {

namespace {

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n\f\v");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t\r\n\f\v");
  return text.substr(begin, end - begin + 1);
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

RagService::RagService(KnowledgeStore& store, Embedder& embedder, GenerationProvider& provider,
                       RetrievalOptions options)
    : store_(store), embedder_(embedder), provider_(provider), options_(std::move(options)) {}

int RagService::effective_top_k(const ChatbotConfig& chatbot, std::optional<int> top_k) const {
  int k = options_.default_top_k;
  if (top_k) {
    k = *top_k;
  } else if (chatbot.top_k > 0) {
    k = chatbot.top_k;
  }
  return std::max(k, 1);
}

std::string RagService::compose_system_prompt(const ChatbotConfig& chatbot) {
  std::string prompt = DEFAULT_BEHAVIOR_PROMPT;
  if (!chatbot.system_prompt.empty()) {
    prompt += "\n\n" + chatbot.system_prompt;
  }
  return prompt;
}

std::string RagService::build_context_block(const std::vector<RetrievedChunk>& chunks) {
  std::string block;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    const std::string& source =
        chunk.document_name.empty() ? chunk.document_id : chunk.document_name;
    char score[32];
    std::snprintf(score, sizeof(score), "%.3f", static_cast<double>(chunk.score));

    if (i > 0) {
      block += "\n\n";
    }
    block += "[" + std::to_string(i + 1) + "] Source: " + source + " (score: " + score + ")\n" +
             trim(chunk.content);
  }
  return block;
}

std::string RagService::compose_user_turn(const std::string& context_block,
                                          const std::string& message) {
  const std::string context = context_block.empty() ? EMPTY_CONTEXT_TEXT : context_block;
  return std::string(ANSWER_INSTRUCTIONS) + "\n\nContext:\n" + context + "\n\nUser question:\n" +
         trim(message);
}

std::vector<ConversationTurn> RagService::normalize_history(
    const std::vector<HistoryTurn>& history) {
  std::vector<ConversationTurn> turns;
  turns.reserve(history.size());
  for (const auto& entry : history) {
    const std::string role = to_lower(entry.role);
    if (role == "user") {
      turns.push_back({TurnRole::User, entry.content});
    } else if (role == "assistant" || role == "model") {
      turns.push_back({TurnRole::Model, entry.content});
    } else {
      std::cerr << "Warning: [Rag] Dropping history turn with unknown role '" << entry.role << "'"
                << std::endl;
    }
  }
  return turns;
}

std::vector<RetrievedChunk> RagService::retrieve(const ChatbotConfig& chatbot,
                                                 const std::string& query, int top_k) {
  const std::vector<float> query_vector = embedder_.embed_one(query);
  if (query_vector.empty()) {
    throw EmbedderError("Embedder returned an empty query vector");
  }

  VectorIndex index(options_.vector_index, chatbot.id, query_vector.size());
  const std::vector<IndexSearchHit> hits = index.search(query_vector, top_k);

  std::vector<IndexSearchHit> ranked;
  std::unordered_set<std::string> seen;
  for (const auto& hit : hits) {
    if (!is_valid_uuid(hit.chunk_id)) {
      std::cerr << "Warning: [Rag] Skipping malformed chunk id '" << hit.chunk_id
                << "' in index of chatbot " << chatbot.id << std::endl;
      continue;
    }
    if (seen.insert(hit.chunk_id).second) {
      ranked.push_back(hit);
    }
  }
  if (ranked.empty()) {
    return {};
  }

  std::vector<std::string> ids;
  ids.reserve(ranked.size());
  for (const auto& hit : ranked) {
    ids.push_back(hit.chunk_id);
  }
  std::unordered_map<std::string, ChunkWithSource> rows;
  for (auto& row : store_.get_chunks_by_ids(chatbot.id, ids)) {
    std::string id = row.chunk.id;
    rows.emplace(std::move(id), std::move(row));
  }

  std::vector<RetrievedChunk> results;
  results.reserve(ranked.size());
  for (const auto& hit : ranked) {
    auto it = rows.find(hit.chunk_id);
    if (it == rows.end()) {
      std::cerr << "Warning: [Rag] Chunk " << hit.chunk_id << " is indexed but has no row"
                << std::endl;
      continue;
    }
    RetrievedChunk chunk;
    chunk.chunk_id = hit.chunk_id;
    chunk.document_id = it->second.chunk.document_id;
    chunk.document_name = it->second.document_name;
    chunk.score = hit.score;
    chunk.content = it->second.chunk.content;
    results.push_back(std::move(chunk));
  }
  return results;
}

RagResponse RagService::respond(const ChatbotConfig& chatbot, const std::string& message,
                                const std::vector<HistoryTurn>& history,
                                std::optional<int> top_k) {
  if (trim(message).empty()) {
    throw RagValidationError("Message must not be empty");
  }

  try {
    RagResponse response;
    response.context = retrieve(chatbot, message, effective_top_k(chatbot, top_k));

    std::vector<ConversationTurn> turns = normalize_history(history);
    turns.push_back({TurnRole::User,
                     compose_user_turn(build_context_block(response.context), message)});

    GenerationParams params;
    params.temperature = chatbot.temperature;
    params.max_output_tokens = options_.max_output_tokens;
    params.model = chatbot.model_name;
    response.answer = provider_.generate(compose_system_prompt(chatbot), turns, params);
    return response;
  } catch (const std::exception& e) {
    throw RagGenerationError(std::string("Failed to generate response: ") + e.what());
  }
}

}  // namespace rag_core
