#include "rag_core/vector/vector_index.hpp"

#include <iostream>
#include <system_error>

#include "rag_core/vector/file_lock.hpp"
#include "rag_core/vector/index_metadata.hpp"

namespace rag_core {

namespace {

VectorBackendKind other_backend(VectorBackendKind kind) {
  return kind == VectorBackendKind::Faiss ? VectorBackendKind::Matrix : VectorBackendKind::Faiss;
}

void validate_chatbot_id(const std::string& chatbot_id) {
  if (chatbot_id.empty() || chatbot_id == "." || chatbot_id == ".." ||
      chatbot_id.find_first_of("/\\") != std::string::npos) {
    throw VectorIndexError("Invalid chatbot id for vector index: '" + chatbot_id + "'");
  }
}

fs::path tmp_sibling(const fs::path& path) {
  return fs::path(path.string() + ".tmp");
}

// Last committed blob, kept until the metadata naming its rows is in place
fs::path previous_sibling(const fs::path& path) {
  return fs::path(path.string() + ".prev");
}

void replace_file(const fs::path& tmp, const fs::path& target) {
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw VectorIndexError("Could not move " + tmp.string() + " into place: " + ec.message());
  }
}

}  // namespace

VectorIndex::VectorIndex(const fs::path& root, const std::string& chatbot_id, size_t dimension,
                         VectorBackendKind backend)
    : root_(root),
      chatbot_id_(chatbot_id),
      requested_dimension_(dimension),
      dimension_(dimension),
      backend_kind_(backend) {
  validate_chatbot_id(chatbot_id_);

  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw VectorIndexError("Could not create vector store directory " + root_.string() + ": " +
                           ec.message());
  }

  FileLock lock(artifact_path(".lock"), LockMode::Shared);
  load_unlocked();
}

VectorIndex::VectorIndex(const VectorIndexOptions& options, const std::string& chatbot_id,
                         size_t dimension)
    : VectorIndex(options.root, chatbot_id, dimension, options.backend) {}

VectorIndex::~VectorIndex() = default;

fs::path VectorIndex::artifact_path(const std::string& extension) const {
  return root_ / (chatbot_id_ + extension);
}

void VectorIndex::reload() {
  FileLock lock(artifact_path(".lock"), LockMode::Shared);
  load_unlocked();
}

void VectorIndex::load_unlocked() {
  chunk_ids_.clear();
  dimension_ = requested_dimension_;

  auto metadata = read_index_metadata(artifact_path(".json"));
  if (metadata) {
    if (metadata->dimension > 0) {
      dimension_ = metadata->dimension;
    }
    chunk_ids_ = std::move(metadata->chunk_ids);
  }

  backend_ = make_index_backend(backend_kind_, dimension_);

  const fs::path primary = artifact_path(blob_extension(backend_kind_));
  const VectorBackendKind alternate_kind = other_backend(backend_kind_);
  const fs::path alternate = artifact_path(blob_extension(alternate_kind));
  if (fs::exists(primary)) {
    backend_->load(primary);
    const fs::path previous = previous_sibling(primary);
    if (backend_->size() != chunk_ids_.size() && fs::exists(previous)) {
      // a write stopped between moving the blob and the metadata into place
      backend_ = make_index_backend(backend_kind_, dimension_);
      backend_->load(previous);
    }
  } else if (fs::exists(alternate)) {
    // written while the other backend was configured
    auto imported = make_index_backend(alternate_kind, dimension_);
    imported->load(alternate);
    const auto rows = imported->rows();
    backend_->add(rows.data(), imported->size());
  }
}

void VectorIndex::persist_unlocked() const {
  const fs::path blob = artifact_path(blob_extension(backend_kind_));
  const fs::path metadata_path = artifact_path(".json");
  const fs::path previous = previous_sibling(blob);

  // both generations are staged before either one is moved into place
  backend_->save(tmp_sibling(blob));
  try {
    write_index_metadata(tmp_sibling(metadata_path), IndexMetadata{chunk_ids_, dimension_});
  } catch (const VectorIndexError&) {
    std::error_code ec;
    fs::remove(tmp_sibling(blob), ec);
    throw;
  }

  auto discard_staged = [&]() {
    std::error_code ec;
    fs::remove(tmp_sibling(blob), ec);
    fs::remove(tmp_sibling(metadata_path), ec);
  };
  // puts the committed blob back so it matches the untouched metadata
  auto restore_previous = [&](bool had_blob) {
    std::error_code ec;
    if (had_blob) {
      fs::rename(previous, blob, ec);
    } else {
      fs::remove(blob, ec);
    }
    if (ec) {
      throw IndexCorruptionError("Could not restore " + blob.string() + " after a failed write: " +
                                 ec.message());
    }
  };

  const bool had_blob = fs::exists(blob);
  if (had_blob) {
    std::error_code ec;
    fs::rename(blob, previous, ec);
    if (ec) {
      discard_staged();
      throw VectorIndexError("Could not set aside " + blob.string() + ": " + ec.message());
    }
  }

  try {
    replace_file(tmp_sibling(blob), blob);
  } catch (const VectorIndexError&) {
    discard_staged();
    restore_previous(had_blob);
    throw;
  }
  try {
    replace_file(tmp_sibling(metadata_path), metadata_path);
  } catch (const VectorIndexError&) {
    restore_previous(had_blob);
    throw;
  }

  std::error_code ec;
  if (had_blob) {
    fs::remove(previous, ec);
    if (ec) {
      std::cerr << "Warning: Could not remove " << previous.string() << ": " << ec.message()
                << std::endl;
    }
  }

  // the other backend's blob no longer has every row
  fs::remove(artifact_path(blob_extension(other_backend(backend_kind_))), ec);
  if (ec) {
    std::cerr << "Warning: Could not remove stale index blob for chatbot " << chatbot_id_ << ": "
              << ec.message() << std::endl;
  }
}

void VectorIndex::check_width(const std::vector<float>& vector) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
}

void VectorIndex::add(const std::vector<std::vector<float>>& vectors,
                      const std::vector<std::string>& chunk_ids) {
  if (vectors.size() != chunk_ids.size()) {
    throw VectorIndexError("Got " + std::to_string(vectors.size()) + " vectors for " +
                           std::to_string(chunk_ids.size()) + " chunk ids");
  }
  if (vectors.empty()) {
    return;
  }
  for (const auto& vector : vectors) {
    check_width(vector);
  }

  FileLock lock(artifact_path(".lock"), LockMode::Exclusive);
  // another writer may have appended since this instance loaded
  load_unlocked();
  for (const auto& vector : vectors) {
    check_width(vector);
  }
  if (backend_->size() != chunk_ids_.size()) {
    throw IndexCorruptionError("Vector index for chatbot " + chatbot_id_ + " holds " +
                               std::to_string(backend_->size()) + " vectors but " +
                               std::to_string(chunk_ids_.size()) + " chunk ids");
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension_);
  for (const auto& vector : vectors) {
    flat.insert(flat.end(), vector.begin(), vector.end());
  }
  backend_->add(flat.data(), vectors.size());
  chunk_ids_.insert(chunk_ids_.end(), chunk_ids.begin(), chunk_ids.end());

  try {
    persist_unlocked();
  } catch (const std::exception& e) {
    std::cerr << "Warning: Persisting vector index for chatbot " << chatbot_id_
              << " failed, reloading: " << e.what() << std::endl;
    load_unlocked();
    throw;
  }
}

std::vector<IndexSearchHit> VectorIndex::search(const std::vector<float>& query, int top_k) const {
  if (top_k <= 0) {
    return {};
  }
  check_width(query);
  if (backend_->size() != chunk_ids_.size()) {
    throw IndexCorruptionError("Vector index for chatbot " + chatbot_id_ + " holds " +
                               std::to_string(backend_->size()) + " vectors but " +
                               std::to_string(chunk_ids_.size()) + " chunk ids");
  }
  if (chunk_ids_.empty()) {
    return {};
  }

  const auto hits = backend_->search(query.data(), static_cast<size_t>(top_k));
  std::vector<IndexSearchHit> results;
  results.reserve(hits.size());
  for (const auto& hit : hits) {
    results.push_back({chunk_ids_.at(hit.row), hit.score});
  }
  return results;
}

void VectorIndex::remove(const fs::path& root, const std::string& chatbot_id) {
  validate_chatbot_id(chatbot_id);
  const fs::path lock_path = root / (chatbot_id + ".lock");
  if (!fs::exists(root)) {
    return;
  }

  FileLock lock(lock_path, LockMode::Exclusive);
  for (const char* extension : {".json", ".faiss", ".npy", ".faiss.prev", ".npy.prev"}) {
    std::error_code ec;
    fs::remove(root / (chatbot_id + extension), ec);
    if (ec) {
      throw VectorIndexError("Could not remove " + (root / (chatbot_id + extension)).string() +
                             ": " + ec.message());
    }
  }
}

}  // namespace rag_core
