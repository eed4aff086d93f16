#include "rag_core/vector/index_backend.hpp"

#include <algorithm>

#include "rag_core/vector/faiss_backend.hpp"
#include "rag_core/vector/matrix_backend.hpp"
#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

const char* to_string(VectorBackendKind kind) {
  switch (kind) {
    case VectorBackendKind::Faiss:
      return "faiss";
    case VectorBackendKind::Matrix:
      return "matrix";
  }
  return "unknown";
}

VectorBackendKind vector_backend_from_string(const std::string& name) {
  if (name == "faiss") return VectorBackendKind::Faiss;
  if (name == "matrix") return VectorBackendKind::Matrix;
  throw VectorIndexError("Unknown vector backend: " + name);
}

const char* blob_extension(VectorBackendKind kind) {
  return kind == VectorBackendKind::Faiss ? ".faiss" : ".npy";
}

void rank_hits(std::vector<BackendHit>& hits, size_t top_k) {
  auto better = [](const BackendHit& a, const BackendHit& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.row < b.row;
  };
  const size_t keep = std::min(top_k, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(keep), hits.end(),
                    better);
  hits.resize(keep);
}

std::unique_ptr<IndexBackend> make_index_backend(VectorBackendKind kind, size_t dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Vector index dimension must be positive");
  }
  if (kind == VectorBackendKind::Faiss) {
    return std::make_unique<FaissBackend>(dimension);
  }
  return std::make_unique<MatrixBackend>(dimension);
}

}  // namespace rag_core
