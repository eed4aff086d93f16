#include "rag_core/vector/faiss_backend.hpp"

#include <algorithm>

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

FaissBackend::FaissBackend(size_t dimension)
    : dimension_(dimension),
      index_(std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension))) {}

FaissBackend::~FaissBackend() = default;

size_t FaissBackend::size() const {
  return static_cast<size_t>(index_->ntotal);
}

void FaissBackend::add(const float* rows, size_t count) {
  if (count == 0) {
    return;
  }
  try {
    index_->add(static_cast<faiss::idx_t>(count), rows);
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("FAISS add failed: " + std::string(e.what()));
  }
}

std::vector<BackendHit> FaissBackend::search(const float* query, size_t top_k) const {
  const auto total = static_cast<size_t>(index_->ntotal);
  if (total == 0 || top_k == 0) {
    return {};
  }

  // FAISS does not order equal scores. Widen the request until the last
  // returned score is below the cut so that ties are resolved by row.
  size_t k = std::min(total, top_k + kTieMargin);
  std::vector<BackendHit> hits;
  while (true) {
    std::vector<float> distances(k);
    std::vector<faiss::idx_t> labels(k);
    try {
      index_->search(1, query, static_cast<faiss::idx_t>(k), distances.data(), labels.data());
    } catch (const faiss::FaissException& e) {
      throw VectorIndexError("FAISS search failed: " + std::string(e.what()));
    }

    hits.clear();
    hits.reserve(k);
    for (size_t i = 0; i < k; ++i) {
      if (labels[i] < 0) {
        continue;
      }
      hits.push_back({static_cast<size_t>(labels[i]), distances[i]});
    }
    if (k == total || hits.size() <= top_k) {
      break;
    }
    rank_hits(hits, hits.size());
    if (hits.back().score < hits[top_k - 1].score) {
      break;
    }
    k = std::min(total, k * 2);
  }

  rank_hits(hits, top_k);
  return hits;
}

std::vector<float> FaissBackend::rows() const {
  std::vector<float> out(size() * dimension_);
  if (!out.empty()) {
    index_->reconstruct_n(0, index_->ntotal, out.data());
  }
  return out;
}

void FaissBackend::load(const std::filesystem::path& path) {
  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(path.c_str()));
  } catch (const faiss::FaissException& e) {
    throw IndexCorruptionError("Could not read FAISS index " + path.string() + ": " + e.what());
  }
  if (loaded->metric_type != faiss::METRIC_INNER_PRODUCT) {
    throw IndexCorruptionError("FAISS index " + path.string() + " is not an inner-product index");
  }
  if (static_cast<size_t>(loaded->d) != dimension_) {
    throw IndexCorruptionError("FAISS index " + path.string() + " has " +
                               std::to_string(loaded->d) + " dimensions, metadata records " +
                               std::to_string(dimension_));
  }
  index_ = std::move(loaded);
}

void FaissBackend::save(const std::filesystem::path& path) const {
  try {
    faiss::write_index(index_.get(), path.c_str());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Could not write FAISS index " + path.string() + ": " + e.what());
  }
}

}  // namespace rag_core
