#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace rag_core {

// 2-D little-endian float32 matrix in C order
struct NpyMatrix {
  size_t rows = 0;
  size_t cols = 0;
  std::vector<float> data;
};

// Writes a NumPy format 1.0 file holding a (rows, cols) '<f4' array.
// Throws VectorIndexError on I/O failure.
void write_npy_matrix(const std::filesystem::path& path, const NpyMatrix& matrix);

// Reads a 2-D '<f4' C-order array saved by NumPy (format 1.x or 2.x).
// Throws IndexCorruptionError when the file is not such an array.
NpyMatrix read_npy_matrix(const std::filesystem::path& path);

}  // namespace rag_core
