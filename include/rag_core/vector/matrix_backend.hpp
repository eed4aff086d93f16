#pragma once

#include <vector>

#include "rag_core/vector/index_backend.hpp"

namespace rag_core {

// Growable row-major matrix searched by a linear dot-product scan,
// persisted as a .npy array.
class MatrixBackend : public IndexBackend {
 public:
  explicit MatrixBackend(size_t dimension) : dimension_(dimension) {}

  VectorBackendKind kind() const override { return VectorBackendKind::Matrix; }
  size_t dimension() const override { return dimension_; }
  size_t size() const override { return data_.size() / dimension_; }

  void add(const float* rows, size_t count) override;
  std::vector<BackendHit> search(const float* query, size_t top_k) const override;
  std::vector<float> rows() const override { return data_; }

  void load(const std::filesystem::path& path) override;
  void save(const std::filesystem::path& path) const override;

 private:
  size_t dimension_;
  std::vector<float> data_;
};

}  // namespace rag_core
