#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rag_core/chunking/text_chunker.hpp"

namespace rag_core {

namespace {

std::string numbered_words(int count) {
  std::string text;
  for (int i = 0; i < count; ++i) {
    text += "w" + std::to_string(i) + (i % 7 == 6 ? "\n" : " ");
  }
  return text;
}

}  // namespace

TEST(TextChunkerTest, SplitsIntoWindowsWithoutOverlap) {
  auto chunks = chunk_text("alpha beta gamma", 2, 0);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "alpha beta");
  EXPECT_EQ(chunks[1], "gamma");
}

TEST(TextChunkerTest, OverlappingWindowsShareWords) {
  auto chunks = chunk_text("a b c d e f", 4, 2);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "a b c d");
  EXPECT_EQ(chunks[1], "c d e f");
  EXPECT_EQ(chunks[2], "e f");
}

TEST(TextChunkerTest, EmptyAndWhitespaceInputGiveNoChunks) {
  EXPECT_TRUE(chunk_text("", 10, 2).empty());
  EXPECT_TRUE(chunk_text("   ", 10, 2).empty());
  EXPECT_TRUE(chunk_text("\n\t  \r\n", 10, 2).empty());
}

TEST(TextChunkerTest, CollapsesWhitespaceBetweenWords) {
  auto chunks = chunk_text("  one\t\ttwo\n\nthree   ", 10, 0);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "one two three");
}

TEST(TextChunkerTest, OverlapNotSmallerThanSizeStillAdvances) {
  auto chunks = chunk_text("a b c", 2, 5);

  // step is clamped to one word
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "a b");
  EXPECT_EQ(chunks[1], "b c");
  EXPECT_EQ(chunks[2], "c");
}

TEST(TextChunkerTest, ChunksNeverExceedSizeAndAreDeterministic) {
  const std::string text = numbered_words(137);
  const std::vector<std::pair<int, int>> params = {{1, 0}, {5, 1}, {10, 3}, {50, 49}, {200, 10}};

  for (const auto& [size, overlap] : params) {
    auto first = chunk_text(text, size, overlap);
    auto second = chunk_text(text, size, overlap);
    EXPECT_EQ(first, second) << "size=" << size << " overlap=" << overlap;
    ASSERT_FALSE(first.empty());
    for (const auto& chunk : first) {
      EXPECT_LE(count_words(chunk), size) << "size=" << size << " overlap=" << overlap;
      EXPECT_GT(count_words(chunk), 0);
    }
  }
}

TEST(TextChunkerTest, EveryWordIsCovered) {
  const std::string text = numbered_words(23);
  auto chunks = chunk_text(text, 5, 2);

  std::string joined;
  for (const auto& chunk : chunks) {
    joined += " " + chunk + " ";
  }
  for (int i = 0; i < 23; ++i) {
    EXPECT_NE(joined.find(" w" + std::to_string(i) + " "), std::string::npos) << i;
  }
  EXPECT_EQ(chunks.front().substr(0, 3), "w0 ");
  EXPECT_NE(chunks.back().find("w22"), std::string::npos);
}

TEST(TextChunkerTest, RejectsInvalidParameters) {
  EXPECT_THROW(chunk_text("a b", 0, 0), std::invalid_argument);
  EXPECT_THROW(chunk_text("a b", -3, 0), std::invalid_argument);
  EXPECT_THROW(chunk_text("a b", 3, -1), std::invalid_argument);
}

TEST(TextChunkerTest, CountWords) {
  EXPECT_EQ(count_words(""), 0);
  EXPECT_EQ(count_words("  "), 0);
  EXPECT_EQ(count_words("alpha beta\ngamma"), 3);
}

}  // namespace rag_core
