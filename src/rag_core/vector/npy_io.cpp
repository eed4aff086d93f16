#include "rag_core/vector/npy_io.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <system_error>
#include <regex>
#include <stdexcept>
#include <string>

#include "rag_core/vector/vector_index_error.hpp"

namespace rag_core {

namespace {

constexpr char NPY_MAGIC[] = "\x93NUMPY";
constexpr size_t NPY_MAGIC_LEN = 6;
constexpr size_t NPY_ALIGNMENT = 64;

}  // namespace

void write_npy_matrix(const std::filesystem::path& path, const NpyMatrix& matrix) {
  if (matrix.data.size() != matrix.rows * matrix.cols) {
    throw VectorIndexError("Matrix data does not match its shape");
  }

  std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
                       std::to_string(matrix.rows) + ", " + std::to_string(matrix.cols) + "), }";
  // magic + version (2) + header length (2) + header, padded so the data starts aligned
  const size_t preamble = NPY_MAGIC_LEN + 2 + 2;
  size_t total = preamble + header.size() + 1;
  const size_t padding = (NPY_ALIGNMENT - total % NPY_ALIGNMENT) % NPY_ALIGNMENT;
  header.append(padding, ' ');
  header.push_back('\n');

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw VectorIndexError("Could not open " + path.string() + " for writing");
  }

  const uint16_t header_len = static_cast<uint16_t>(header.size());
  const unsigned char version_and_len[4] = {1, 0, static_cast<unsigned char>(header_len & 0xff),
                                            static_cast<unsigned char>(header_len >> 8)};
  out.write(NPY_MAGIC, NPY_MAGIC_LEN);
  out.write(reinterpret_cast<const char*>(version_and_len), sizeof(version_and_len));
  out.write(header.data(), static_cast<std::streamsize>(header.size()));
  out.write(reinterpret_cast<const char*>(matrix.data.data()),
            static_cast<std::streamsize>(matrix.data.size() * sizeof(float)));
  out.flush();
  if (!out) {
    throw VectorIndexError("Failed writing " + path.string());
  }
}

NpyMatrix read_npy_matrix(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw VectorIndexError("Could not open " + path.string());
  }

  std::error_code size_ec;
  const uintmax_t file_size = std::filesystem::file_size(path, size_ec);
  if (size_ec) {
    throw VectorIndexError("Could not stat " + path.string() + ": " + size_ec.message());
  }

  char magic[NPY_MAGIC_LEN];
  unsigned char version[2];
  in.read(magic, NPY_MAGIC_LEN);
  in.read(reinterpret_cast<char*>(version), 2);
  if (!in || std::memcmp(magic, NPY_MAGIC, NPY_MAGIC_LEN) != 0) {
    throw IndexCorruptionError(path.string() + " is not a .npy file");
  }

  size_t header_len = 0;
  if (version[0] == 1) {
    unsigned char len[2];
    in.read(reinterpret_cast<char*>(len), 2);
    header_len = len[0] | (static_cast<size_t>(len[1]) << 8);
  } else if (version[0] == 2 || version[0] == 3) {
    unsigned char len[4];
    in.read(reinterpret_cast<char*>(len), 4);
    header_len = len[0] | (static_cast<size_t>(len[1]) << 8) | (static_cast<size_t>(len[2]) << 16) |
                 (static_cast<size_t>(len[3]) << 24);
  } else {
    throw IndexCorruptionError("Unsupported .npy version in " + path.string());
  }

  const auto header_start = static_cast<uintmax_t>(in.tellg());
  if (!in || header_len > file_size - header_start) {
    throw IndexCorruptionError("Truncated .npy header in " + path.string());
  }

  std::string header(header_len, '\0');
  in.read(header.data(), static_cast<std::streamsize>(header_len));
  if (!in) {
    throw IndexCorruptionError("Truncated .npy header in " + path.string());
  }

  static const std::regex descr_re(R"('descr'\s*:\s*'([^']*)')");
  static const std::regex order_re(R"('fortran_order'\s*:\s*(True|False))");
  static const std::regex shape_re(R"('shape'\s*:\s*\(\s*(\d+)\s*,\s*(\d+)\s*,?\s*\))");
  std::smatch match;

  if (!std::regex_search(header, match, descr_re) || match[1] != "<f4") {
    throw IndexCorruptionError("Expected a little-endian float32 array in " + path.string());
  }
  if (!std::regex_search(header, match, order_re) || match[1] != "False") {
    throw IndexCorruptionError("Expected a C-order array in " + path.string());
  }
  if (!std::regex_search(header, match, shape_re)) {
    throw IndexCorruptionError("Expected a 2-D array in " + path.string());
  }

  NpyMatrix matrix;
  try {
    matrix.rows = std::stoull(match[1].str());
    matrix.cols = std::stoull(match[2].str());
  } catch (const std::out_of_range&) {
    throw IndexCorruptionError("Shape out of range in " + path.string());
  }

  // the shape has to be backed by the bytes that follow the header
  const uintmax_t available = (file_size - header_start - header_len) / sizeof(float);
  if (matrix.cols != 0 && matrix.rows > available / matrix.cols) {
    throw IndexCorruptionError("Shape (" + std::to_string(matrix.rows) + ", " +
                               std::to_string(matrix.cols) + ") exceeds the data in " +
                               path.string());
  }
  matrix.data.resize(matrix.rows * matrix.cols);
  in.read(reinterpret_cast<char*>(matrix.data.data()),
          static_cast<std::streamsize>(matrix.data.size() * sizeof(float)));
  if (!in) {
    throw IndexCorruptionError("Truncated .npy data in " + path.string());
  }
  return matrix;
}

}  // namespace rag_core
