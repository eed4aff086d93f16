#include "rag_core/services/ingestion_service.hpp"

#include <iostream>
#include <system_error>

#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/db/knowledge_store.hpp"
#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/extractors/content_extractor_factory.hpp"
#include "rag_core/storage/object_storage.hpp"
#include "rag_core/types/uuid.hpp"

namespace rag_core {

namespace {

// Removes the staged copy of a document when the pipeline leaves scope
class ScratchFile {
 public:
  explicit ScratchFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~ScratchFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      std::cerr << "Warning: Could not remove scratch file " << path_ << ": " << ec.message()
                << std::endl;
    }
  }

  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

void report(const ProgressUpdater& on_progress, float percent, const std::string& message) {
  if (on_progress) {
    on_progress(percent, message);
  }
}

// Every vector of a batch must have the width of the first one
size_t batch_width(const std::vector<std::vector<float>>& vectors, size_t expected_count) {
  if (vectors.size() != expected_count) {
    throw IngestionError("Embedder returned " + std::to_string(vectors.size()) +
                         " vectors for " + std::to_string(expected_count) + " chunks");
  }
  const size_t width = vectors.front().size();
  if (width == 0) {
    throw IngestionError("Embedder returned an empty vector");
  }
  for (const auto& vector : vectors) {
    if (vector.size() != width) {
      throw IngestionError("Embedder returned vectors of differing widths (" +
                           std::to_string(width) + " and " + std::to_string(vector.size()) + ")");
    }
  }
  return width;
}

}  // namespace

IngestionService::IngestionService(KnowledgeStore& store, ObjectStorage& storage,
                                   ContentExtractorFactory& extractors, Embedder& embedder,
                                   IngestionOptions options)
    : store_(store),
      storage_(storage),
      extractors_(extractors),
      embedder_(embedder),
      options_(std::move(options)) {
  if (options_.chunk_size <= 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (options_.chunk_overlap < 0) {
    throw std::invalid_argument("chunk_overlap must not be negative");
  }
}

std::filesystem::path IngestionService::scratch_path_for(const std::string& file_name) const {
  std::filesystem::path directory = options_.scratch_directory.empty()
                                        ? std::filesystem::temp_directory_path()
                                        : options_.scratch_directory;
  std::filesystem::create_directories(directory);
  // keep the extension, extractors look at it
  return directory / ("rag-" + generate_uuid() + "-" +
                      std::filesystem::path(file_name).filename().string());
}

void IngestionService::ingest(const std::string& document_id, const ProgressUpdater& on_progress) {
  std::optional<Document> document = store_.get_document(document_id);
  if (!document) {
    throw IngestionError("Document not found: " + document_id);
  }
  if (document->status != DocumentStatus::Pending) {
    std::cerr << "Warning: [Ingestion] Document " << document_id << " is "
              << to_string(document->status) << ", expected pending; ingesting anyway"
              << std::endl;
  }

  store_.update_document_status(document_id, DocumentStatus::Processing);
  report(on_progress, 0.0f, "Processing started");
  std::cout << "[Ingestion] Processing document " << document_id << " (" << document->file_name
            << ", " << document->mime_type << ")" << std::endl;

  try {
    // 1. Stage the original locally
    ScratchFile scratch(scratch_path_for(document->file_name));
    storage_.download(document->storage_key, scratch.path());
    report(on_progress, 0.1f, "Downloaded");

    // 2. Extract
    const ContentExtractor& extractor =
        extractors_.get_extractor_for(document->mime_type, scratch.path());
    const std::string text = extractor.extract_text(scratch.path());
    report(on_progress, 0.3f, "Text extracted");

    // 3. Chunk
    std::vector<std::string> texts =
        chunk_text(text, options_.chunk_size, options_.chunk_overlap);
    if (texts.empty()) {
      throw IngestionError("No textual content detected in document.");
    }
    report(on_progress, 0.4f, std::to_string(texts.size()) + " chunks");

    // 4. Embed
    std::vector<std::vector<float>> vectors = embedder_.embed_many(texts);
    const size_t width = batch_width(vectors, texts.size());
    report(on_progress, 0.7f, "Chunks embedded");

    // 5. Check the chatbot's index before touching any rows
    VectorIndex index(options_.vector_index, document->chatbot_id, width);
    if (index.dimension() != width) {
      throw IngestionError("Embedding dimension " + std::to_string(width) +
                           " does not match the chatbot's vector index dimension " +
                           std::to_string(index.dimension()) +
                           "; the embedding model changed, rebuild the index for chatbot " +
                           document->chatbot_id);
    }

    // 6. Chunk and embedding rows, one transaction
    std::vector<ChunkRecord> chunks;
    std::vector<EmbeddingRecord> embeddings;
    std::vector<std::string> chunk_ids;
    chunks.reserve(texts.size());
    embeddings.reserve(texts.size());
    chunk_ids.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
      ChunkRecord chunk;
      chunk.id = generate_uuid();
      chunk.chatbot_id = document->chatbot_id;
      chunk.document_id = document->id;
      chunk.chunk_index = static_cast<int>(i);
      chunk.token_count = static_cast<int>(count_words(texts[i]));
      chunk.content = std::move(texts[i]);

      EmbeddingRecord embedding;
      embedding.id = generate_uuid();
      embedding.chunk_id = chunk.id;
      embedding.dimension = static_cast<int>(width);
      embedding.embedding_model = embedder_.model_id();
      embedding.vector = vectors[i];

      chunk_ids.push_back(chunk.id);
      chunks.push_back(std::move(chunk));
      embeddings.push_back(std::move(embedding));
    }
    store_.insert_chunks(chunks, embeddings);
    report(on_progress, 0.85f, "Chunks stored");

    // 7. Vector index
    try {
      index.add(vectors, chunk_ids);
    } catch (const std::exception& e) {
      // rows without vectors would never be retrieved; drop them
      try {
        store_.delete_document_chunks(document->id);
      } catch (const KnowledgeStoreError& cleanup_error) {
        std::cerr << "Warning: [Ingestion] Could not remove chunks of document " << document->id
                  << ": " << cleanup_error.what() << std::endl;
      }
      throw;
    }

    store_.update_document_status(document_id, DocumentStatus::Ready);
    report(on_progress, 1.0f, "Ready");
    std::cout << "[Ingestion] Document " << document_id << " ready with " << chunk_ids.size()
              << " chunks" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[Ingestion] Document " << document_id << " failed: " << e.what() << std::endl;
    store_.update_document_status(document_id, DocumentStatus::Failed, std::string(e.what()));
    report(on_progress, 1.0f, std::string("Failed: ") + e.what());
  }
}

size_t IngestionService::rebuild_index(const std::string& chatbot_id) {
  if (!store_.get_chatbot(chatbot_id)) {
    throw IngestionError("Chatbot not found: " + chatbot_id);
  }

  std::vector<ChunkRecord> chunks = store_.list_chunks_for_chatbot(chatbot_id);
  if (chunks.empty()) {
    VectorIndex::remove(options_.vector_index.root, chatbot_id);
    std::cout << "[Ingestion] Chatbot " << chatbot_id << " has no chunks; index cleared"
              << std::endl;
    return 0;
  }

  std::vector<std::string> texts;
  std::vector<std::string> chunk_ids;
  texts.reserve(chunks.size());
  chunk_ids.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.content);
    chunk_ids.push_back(chunk.id);
  }

  std::vector<std::vector<float>> vectors = embedder_.embed_many(texts);
  const size_t width = batch_width(vectors, texts.size());

  std::vector<EmbeddingRecord> embeddings;
  embeddings.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    EmbeddingRecord embedding;
    embedding.id = generate_uuid();
    embedding.chunk_id = chunk_ids[i];
    embedding.dimension = static_cast<int>(width);
    embedding.embedding_model = embedder_.model_id();
    embedding.vector = vectors[i];
    embeddings.push_back(std::move(embedding));
  }
  store_.replace_embeddings(embeddings);

  VectorIndex::remove(options_.vector_index.root, chatbot_id);
  VectorIndex index(options_.vector_index, chatbot_id, width);
  index.add(vectors, chunk_ids);

  std::cout << "[Ingestion] Rebuilt index for chatbot " << chatbot_id << ": " << chunk_ids.size()
            << " chunks, " << width << " dimensions (" << embedder_.model_id() << ")"
            << std::endl;
  return chunk_ids.size();
}

}  // namespace rag_core
