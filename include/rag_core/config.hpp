#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/rag_service.hpp"
#include "rag_core/vector/vector_index.hpp"

namespace rag_core {

class Config {
 public:
  std::string database_path;
  std::string object_storage_root;
  std::string vector_store_path;
  std::string vector_backend;
  std::string scratch_directory;

  int chunk_size;
  int chunk_overlap;

  // Embeddings
  std::string embedding_provider;
  bool allow_embedding_fallback;
  std::string ollama_url;
  std::string embedding_model;
  bool normalize_embeddings;
  int fallback_embedding_dimension;

  // Generation
  std::string generation_model;
  int rag_top_k;
  int max_output_tokens;

  // Workers
  int num_workers;
  int worker_poll_interval_ms;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.database_path = json_config.value("database_path", std::string("./data/rag.db"));
    config.object_storage_root =
        json_config.value("object_storage_root", std::string("./data/objects"));
    config.vector_store_path =
        json_config.value("vector_store_path", std::string("./data/vector_store"));
    config.vector_backend = json_config.value("vector_backend", std::string("faiss"));
    config.scratch_directory = json_config.value("scratch_directory", std::string(""));

    config.embedding_provider = json_config.value("embedding_provider", std::string("ollama"));
    config.allow_embedding_fallback = json_config.value("allow_embedding_fallback", true);
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
    config.normalize_embeddings = json_config.value("normalize_embeddings", true);
    config.generation_model = json_config.value("generation_model", std::string("llama3.1"));

    // Integers fall back to their default if the wrong type is provided
    config.chunk_size = int_or_default(json_config, "chunk_size", 500);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 50);
    config.fallback_embedding_dimension =
        int_or_default(json_config, "fallback_embedding_dimension", 48);
    config.rag_top_k = int_or_default(json_config, "rag_top_k", 4);
    config.max_output_tokens = int_or_default(json_config, "max_output_tokens", 1024);
    config.num_workers = int_or_default(json_config, "num_workers", 1);
    config.worker_poll_interval_ms = int_or_default(json_config, "worker_poll_interval_ms", 2000);

    config.validate();
    return config;
  }

  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

  VectorIndexOptions vector_index_options() const {
    VectorIndexOptions options;
    options.root = vector_store_path;
    options.backend = vector_backend_from_string(vector_backend);
    return options;
  }

  EmbedderOptions embedder_options() const {
    EmbedderOptions options;
    options.provider = embedding_provider;
    options.allow_fallback = allow_embedding_fallback;
    options.ollama_url = ollama_url;
    options.model = embedding_model;
    options.normalize = normalize_embeddings;
    options.fallback_dimension = static_cast<size_t>(fallback_embedding_dimension);
    return options;
  }

  IngestionOptions ingestion_options() const {
    IngestionOptions options;
    options.chunk_size = chunk_size;
    options.chunk_overlap = chunk_overlap;
    options.scratch_directory = scratch_directory;
    options.vector_index = vector_index_options();
    return options;
  }

  RetrievalOptions retrieval_options() const {
    RetrievalOptions options;
    options.default_top_k = rag_top_k;
    options.max_output_tokens = max_output_tokens;
    options.vector_index = vector_index_options();
    return options;
  }

  std::chrono::milliseconds worker_poll_interval() const {
    return std::chrono::milliseconds(worker_poll_interval_ms);
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      return fallback;
    }
    return value.get<int>();
  }

  void validate() const {
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (object_storage_root.empty()) {
      throw std::runtime_error("object_storage_root cannot be empty");
    }
    if (vector_store_path.empty()) {
      throw std::runtime_error("vector_store_path cannot be empty");
    }
    if (vector_backend != "faiss" && vector_backend != "matrix") {
      throw std::runtime_error("vector_backend must be 'faiss' or 'matrix'");
    }
    if (embedding_provider != "ollama" && embedding_provider != "hash") {
      throw std::runtime_error("embedding_provider must be 'ollama' or 'hash'");
    }
    if (embedding_provider == "ollama" && (ollama_url.empty() || embedding_model.empty())) {
      throw std::runtime_error("ollama_url and embedding_model are required for the ollama provider");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0) {
      throw std::runtime_error("chunk_overlap cannot be negative");
    }
    if (fallback_embedding_dimension <= 0) {
      throw std::runtime_error("fallback_embedding_dimension must be greater than 0");
    }
    if (rag_top_k < 1) {
      throw std::runtime_error("rag_top_k must be at least 1");
    }
    if (max_output_tokens <= 0) {
      throw std::runtime_error("max_output_tokens must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (worker_poll_interval_ms < 10) {
      throw std::runtime_error("worker_poll_interval_ms must be at least 10ms");
    }
  }
};

}  // namespace rag_core
