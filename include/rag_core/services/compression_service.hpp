#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {

// Chunk content is kept zstd-compressed at rest.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text using Zstandard.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame. Empty input yields an empty buffer.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame produced by compress().
   * @throws std::runtime_error if the buffer is not a zstd frame with a known size.
   */
  static std::string decompress(const std::vector<char>& compressed_data);

  // Upper bound accepted by decompress(); a chunk never gets near this.
  static constexpr unsigned long long MAX_DECOMPRESSED_SIZE = 64ull * 1024 * 1024;
};

}  // namespace rag_core
