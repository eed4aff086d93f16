#include "rag_core/vector/matrix_backend.hpp"

#include "rag_core/vector/npy_io.hpp"
#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

void MatrixBackend::add(const float* rows, size_t count) {
  data_.insert(data_.end(), rows, rows + count * dimension_);
}

std::vector<BackendHit> MatrixBackend::search(const float* query, size_t top_k) const {
  const size_t total = size();
  std::vector<BackendHit> hits;
  hits.reserve(total);
  for (size_t row = 0; row < total; ++row) {
    const float* vector = data_.data() + row * dimension_;
    float score = 0.0f;
    for (size_t i = 0; i < dimension_; ++i) {
      score += vector[i] * query[i];
    }
    hits.push_back({row, score});
  }
  rank_hits(hits, top_k);
  return hits;
}

void MatrixBackend::load(const std::filesystem::path& path) {
  NpyMatrix matrix = read_npy_matrix(path);
  if (matrix.rows > 0 && matrix.cols != dimension_) {
    throw IndexCorruptionError("Matrix " + path.string() + " has " + std::to_string(matrix.cols) +
                               " columns, metadata records " + std::to_string(dimension_));
  }
  data_ = std::move(matrix.data);
}

void MatrixBackend::save(const std::filesystem::path& path) const {
  NpyMatrix matrix;
  matrix.rows = size();
  matrix.cols = dimension_;
  matrix.data = data_;
  write_npy_matrix(path, matrix);
}

}  // namespace rag_core
