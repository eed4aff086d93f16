#pragma once

#include <memory>

#include "rag_core/vector/index_backend.hpp"

namespace faiss {
struct Index;
}

namespace rag_core {

// Exact inner-product search over a faiss::IndexFlatIP
class FaissBackend : public IndexBackend {
 public:
  explicit FaissBackend(size_t dimension);
  ~FaissBackend() override;

  VectorBackendKind kind() const override { return VectorBackendKind::Faiss; }
  size_t dimension() const override { return dimension_; }
  size_t size() const override;

  void add(const float* rows, size_t count) override;
  std::vector<BackendHit> search(const float* query, size_t top_k) const override;
  std::vector<float> rows() const override;

  void load(const std::filesystem::path& path) override;
  void save(const std::filesystem::path& path) const override;

 private:
  // extra results requested beyond top_k to spot ties at the cut
  static constexpr size_t kTieMargin = 8;

  size_t dimension_;
  std::unique_ptr<faiss::Index> index_;
};

}  // namespace rag_core
