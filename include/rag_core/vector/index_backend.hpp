#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rag_core {

enum class VectorBackendKind { Faiss, Matrix };

const char* to_string(VectorBackendKind kind);
// Throws VectorIndexError for anything but "faiss" / "matrix"
VectorBackendKind vector_backend_from_string(const std::string& name);
// ".faiss" or ".npy"
const char* blob_extension(VectorBackendKind kind);

struct BackendHit {
  size_t row;
  float score;
};

// Orders hits by score descending, then storage row ascending, and keeps the first top_k
void rank_hits(std::vector<BackendHit>& hits, size_t top_k);

// Row storage behind a VectorIndex. Rows are addressed by insertion position
// only; chunk identifiers live in the index metadata.
class IndexBackend {
 public:
  virtual ~IndexBackend() = default;

  virtual VectorBackendKind kind() const = 0;
  virtual size_t dimension() const = 0;
  virtual size_t size() const = 0;

  // `rows` holds count * dimension() floats, row-major
  virtual void add(const float* rows, size_t count) = 0;

  // Inner-product search, ranked with rank_hits
  virtual std::vector<BackendHit> search(const float* query, size_t top_k) const = 0;

  // All stored rows, row-major
  virtual std::vector<float> rows() const = 0;

  virtual void load(const std::filesystem::path& path) = 0;
  virtual void save(const std::filesystem::path& path) const = 0;
};

std::unique_ptr<IndexBackend> make_index_backend(VectorBackendKind kind, size_t dimension);

}  // namespace rag_core
