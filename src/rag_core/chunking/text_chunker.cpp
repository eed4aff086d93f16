#include "rag_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace rag_core {

namespace {

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

}  // namespace

std::vector<std::string> chunk_text(const std::string& text, int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw std::invalid_argument("chunk_size must be greater than 0, got " +
                                std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw std::invalid_argument("overlap must not be negative, got " + std::to_string(overlap));
  }

  const std::vector<std::string> words = split_words(text);
  std::vector<std::string> chunks;
  if (words.empty()) {
    return chunks;
  }

  const size_t size = static_cast<size_t>(chunk_size);
  const size_t step = static_cast<size_t>(std::max(chunk_size - overlap, 1));

  for (size_t start = 0; start < words.size(); start += step) {
    const size_t end = std::min(start + size, words.size());
    std::string chunk;
    for (size_t i = start; i < end; ++i) {
      if (!chunk.empty()) {
        chunk += ' ';
      }
      chunk += words[i];
    }
    if (!chunk.empty()) {
      chunks.push_back(std::move(chunk));
    }
  }
  return chunks;
}

int count_words(const std::string& text) {
  return static_cast<int>(split_words(text).size());
}

}  // namespace rag_core
