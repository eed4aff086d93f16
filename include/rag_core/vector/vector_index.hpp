#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/vector/index_backend.hpp"
#include "rag_core/vector/vector_index_error.hpp"

namespace fs = std::filesystem;

namespace rag_core {

struct VectorIndexOptions {
  fs::path root = "./data/vector_store";
  VectorBackendKind backend = VectorBackendKind::Faiss;
};

struct IndexSearchHit {
  std::string chunk_id;
  float score;
};

/**
 * @class VectorIndex
 * @brief Persistent per-chatbot store of (vector, chunk id) pairs.
 *
 * Artifacts live under the root directory, keyed by chatbot id:
 *   <id>.faiss  FAISS IndexFlatIP (faiss backend)
 *   <id>.npy    float32 matrix (matrix backend)
 *   <id>.json   {"chunk_ids": [...], "dimension": n}, shared by both backends
 *   <id>.lock   advisory lock
 *
 * Construction loads the persisted state under a shared lock. A recorded
 * dimension overrides the one passed in. add() re-reads the state under an
 * exclusive lock before appending, and every artifact is replaced by rename,
 * so concurrent writers serialize and readers see whole generations only.
 */
class VectorIndex {
 public:
  VectorIndex(const fs::path& root, const std::string& chatbot_id, size_t dimension,
              VectorBackendKind backend = VectorBackendKind::Faiss);
  VectorIndex(const VectorIndexOptions& options, const std::string& chatbot_id, size_t dimension);
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  /**
   * @brief Appends vectors and their chunk ids, then persists.
   *
   * The batch is rejected as a whole if any vector has the wrong width.
   * @throw DimensionMismatchError, IndexCorruptionError, VectorIndexError
   */
  void add(const std::vector<std::vector<float>>& vectors, const std::vector<std::string>& chunk_ids);

  /**
   * @brief Top-k inner-product search, best first, ties in storage order.
   *
   * top_k <= 0 and an empty index both give an empty result.
   * @throw DimensionMismatchError if the query width differs from the index.
   * @throw IndexCorruptionError if the vector count and chunk id count disagree.
   */
  std::vector<IndexSearchHit> search(const std::vector<float>& query, int top_k) const;

  // Re-reads the persisted state
  void reload();

  size_t dimension() const { return dimension_; }
  size_t size() const { return chunk_ids_.size(); }
  const std::vector<std::string>& chunk_ids() const { return chunk_ids_; }
  VectorBackendKind backend() const { return backend_kind_; }

  // Deletes every artifact of a chatbot's index
  static void remove(const fs::path& root, const std::string& chatbot_id);

 private:
  fs::path root_;
  std::string chatbot_id_;
  size_t requested_dimension_;
  size_t dimension_;
  VectorBackendKind backend_kind_;
  std::unique_ptr<IndexBackend> backend_;
  std::vector<std::string> chunk_ids_;

  fs::path artifact_path(const std::string& extension) const;
  void load_unlocked();
  void persist_unlocked() const;
  void check_width(const std::vector<float>& vector) const;
};

}  // namespace rag_core
