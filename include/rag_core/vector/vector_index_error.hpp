#pragma once

#include <string>

namespace rag_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A vector (to add or to search with) whose width differs from the index
class DimensionMismatchError : public VectorIndexError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : VectorIndexError("Vector dimension mismatch: index has " + std::to_string(expected) +
                         " dimensions, got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

 private:
  size_t expected_;
  size_t actual_;
};

// Persisted artifacts that disagree with each other
class IndexCorruptionError : public VectorIndexError {
 public:
  explicit IndexCorruptionError(const std::string& message) : VectorIndexError(message) {}
};

}  // namespace rag_core
