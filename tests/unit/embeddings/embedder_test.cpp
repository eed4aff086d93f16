#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/embeddings/hash_embedder.hpp"
#include "rag_core/embeddings/ollama_embedder.hpp"

namespace rag_core {

TEST(HashEmbedderTest, SameTextGivesBitIdenticalVectors) {
  HashEmbedder first(48);
  HashEmbedder second(48);

  auto a = first.embed_one("The quick brown fox");
  auto b = second.embed_one("The quick brown fox");

  ASSERT_EQ(a.size(), 48u);
  EXPECT_EQ(a, b);
}

TEST(HashEmbedderTest, DistinctTextsGiveDistinctVectors) {
  HashEmbedder embedder(16);
  std::set<std::vector<float>> seen;
  for (int i = 0; i < 50; ++i) {
    seen.insert(embedder.embed_one("text number " + std::to_string(i)));
  }
  EXPECT_EQ(seen.size(), 50u);
}

TEST(HashEmbedderTest, AllVectorsShareTheConfiguredDimension) {
  HashEmbedder embedder(7);
  auto vectors = embedder.embed_many({"", "a", "a much longer piece of text", "\xF0\x9F\x98\x80"});

  ASSERT_EQ(vectors.size(), 4u);
  for (const auto& vector : vectors) {
    EXPECT_EQ(vector.size(), 7u);
    for (float value : vector) {
      EXPECT_GE(value, 0.0f);
      EXPECT_LT(value, 1.0f);
    }
  }
  EXPECT_EQ(embedder.dimension(), 7u);
}

TEST(HashEmbedderTest, EmbedManyMatchesEmbedOne) {
  HashEmbedder embedder(12);
  auto many = embedder.embed_many({"first", "second"});

  ASSERT_EQ(many.size(), 2u);
  EXPECT_EQ(many[0], embedder.embed_one("first"));
  EXPECT_EQ(many[1], embedder.embed_one("second"));
}

TEST(HashEmbedderTest, IsLabelledAsPlaceholder) {
  HashEmbedder embedder;

  EXPECT_FALSE(embedder.is_semantic());
  EXPECT_EQ(embedder.model_id(), "hash-placeholder-v1");
  EXPECT_EQ(embedder.dimension(), 48u);
}

TEST(HashEmbedderTest, RejectsZeroDimension) {
  EXPECT_THROW(HashEmbedder(0), EmbedderError);
}

TEST(MakeEmbedderTest, HashProviderNeedsNoServer) {
  EmbedderOptions options;
  options.provider = "hash";
  options.fallback_dimension = 32;

  auto embedder = make_embedder(options);

  ASSERT_NE(embedder, nullptr);
  EXPECT_FALSE(embedder->is_semantic());
  EXPECT_EQ(embedder->dimension(), 32u);
}

TEST(MakeEmbedderTest, FallsBackWhenServerIsUnreachable) {
  EmbedderOptions options;
  options.provider = "ollama";
  options.ollama_url = "http://127.0.0.1:1";
  options.allow_fallback = true;
  options.fallback_dimension = 24;

  auto embedder = make_embedder(options);

  ASSERT_NE(embedder, nullptr);
  EXPECT_FALSE(embedder->is_semantic());
  EXPECT_EQ(embedder->model_id(), HashEmbedder::MODEL_ID);
  EXPECT_EQ(embedder->embed_one("hello").size(), 24u);
}

TEST(MakeEmbedderTest, ThrowsWhenServerIsUnreachableAndFallbackDisabled) {
  EmbedderOptions options;
  options.provider = "ollama";
  options.ollama_url = "http://127.0.0.1:1";
  options.allow_fallback = false;

  EXPECT_THROW(make_embedder(options), EmbedderError);
}

TEST(MakeEmbedderTest, RejectsUnknownProvider) {
  EmbedderOptions options;
  options.provider = "word2vec";

  EXPECT_THROW(make_embedder(options), EmbedderError);
}

// Answers with a fixed-width vector and records how many requests overlap
class RecordingEmbeddingClient : public EmbeddingClient {
 public:
  explicit RecordingEmbeddingClient(size_t width) : width_(width) {}

  std::vector<float> request(const std::string& model, const std::string& text) override {
    const int active = ++in_flight_;
    int seen = max_in_flight_.load();
    while (active > seen && !max_in_flight_.compare_exchange_weak(seen, active)) {
    }
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    ++calls_;
    --in_flight_;

    std::vector<float> vector(width_.load(), 0.0f);
    if (!vector.empty()) {
      vector[text.size() % vector.size()] = 3.0f;
      vector[0] += 4.0f;
    }
    return vector;
  }

  std::atomic<size_t> width_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
  std::atomic<int> calls_{0};
};

TEST(OllamaEmbedderTest, ConcurrentEmbedOneIssuesOneRequestAtATime) {
  auto client = std::make_unique<RecordingEmbeddingClient>(12);
  auto* recorder = client.get();
  OllamaEmbedder embedder(std::move(client), "nomic-embed-text", true);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&embedder, &failures, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        try {
          auto vector = embedder.embed_one("worker " + std::to_string(t) + " chunk " +
                                           std::to_string(i));
          if (vector.size() != 12u) {
            ++failures;
          }
        } catch (const EmbedderError&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(recorder->calls_.load(), kThreads * kPerThread);
  EXPECT_EQ(recorder->max_in_flight_.load(), 1);
  EXPECT_EQ(embedder.dimension(), 12u);
}

TEST(OllamaEmbedderTest, NormalizesToUnitLength) {
  OllamaEmbedder embedder(std::make_unique<RecordingEmbeddingClient>(5), "m", true);
  auto vector = embedder.embed_one("abc");

  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  EXPECT_NEAR(norm, 1.0, 1e-5);
}

TEST(OllamaEmbedderTest, RejectsResponseWithDifferentWidth) {
  auto client = std::make_unique<RecordingEmbeddingClient>(6);
  auto* recorder = client.get();
  OllamaEmbedder embedder(std::move(client), "m", false);

  EXPECT_EQ(embedder.embed_one("first").size(), 6u);
  recorder->width_ = 9;
  EXPECT_THROW(embedder.embed_one("second"), EmbedderError);
  EXPECT_EQ(embedder.dimension(), 6u);
}

TEST(OllamaEmbedderTest, RejectsEmptyResponse) {
  OllamaEmbedder embedder(std::make_unique<RecordingEmbeddingClient>(0), "m", false);
  EXPECT_THROW(embedder.embed_one("anything"), EmbedderError);
  EXPECT_EQ(embedder.dimension(), 0u);
}

}  // namespace rag_core
