#pragma once

#include <string>
#include <vector>

namespace rag_core {

/**
 * @brief Splits text into overlapping windows of whitespace-delimited words.
 *
 * Windows hold up to @p chunk_size words and start every
 * max(chunk_size - overlap, 1) words until every word has been covered, so the
 * trailing windows may be shorter. Words inside a window are joined by a single
 * space. Empty or whitespace-only input yields an empty vector.
 *
 * @throws std::invalid_argument if chunk_size <= 0 or overlap < 0.
 */
std::vector<std::string> chunk_text(const std::string& text, int chunk_size = 500,
                                    int overlap = 50);

// Whitespace-delimited word count, used as the stored token estimate of a chunk.
int count_words(const std::string& text);

}  // namespace rag_core
