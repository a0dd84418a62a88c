#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsearch_core/chunking/text_chunker.hpp"
#include "docsearch_core/index/vector_index.hpp"
#include "docsearch_core/llm/embedding_provider.hpp"
#include "docsearch_core/types/search_result.hpp"

namespace docsearch_core {

struct IndexSummary {
  int chunk_count = 0;
  int total_words = 0;
  bool indexed = false;
  size_t dimension = 0;
  nlohmann::json metadata = nlohmann::json::object();
};

class Retriever {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 400;
  static constexpr int DEFAULT_OVERLAP = 50;
  static constexpr int DEFAULT_TOP_K = 3;
  static constexpr float DEFAULT_MIN_SIMILARITY = 0.3f;

  explicit Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider);

  Retriever(const Retriever &) = delete;
  Retriever &operator=(const Retriever &) = delete;

  /**
   * Chunks the text, embeds every chunk in one provider call and replaces the
   * held index. Returns false and drops the previous index when the text yields no
   * chunks. Throws InvalidConfigError for bad parameters before touching the index.
   * Provider failures propagate unchanged and leave the previous index in place.
   */
  bool index_document(const std::string &text,
                      int chunk_size = DEFAULT_CHUNK_SIZE,
                      int overlap = DEFAULT_OVERLAP,
                      const nlohmann::json &metadata = nlohmann::json::object());

  // Empty when nothing is indexed (the provider is not called) or nothing matches
  std::vector<SearchResult> search(const std::string &query,
                                   int top_k = DEFAULT_TOP_K,
                                   float min_similarity = DEFAULT_MIN_SIMILARITY) const;

  // search() followed by ContextAssembler::assemble(); empty means no usable context
  std::string generate_context(const std::string &query,
                               int top_k = DEFAULT_TOP_K,
                               float min_similarity = DEFAULT_MIN_SIMILARITY) const;

  IndexSummary summary() const;

  void clear();

 private:
  struct IndexedDocument {
    std::unique_ptr<VectorIndex> index;
    nlohmann::json metadata;
  };

  std::shared_ptr<const IndexedDocument> current_document() const;
  void publish(std::shared_ptr<const IndexedDocument> document);

  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  TextChunker chunker_;

  // Guards only the pointer swap; the document itself is immutable once published
  mutable std::mutex document_mutex_;
  std::shared_ptr<const IndexedDocument> document_;
};

}  // namespace docsearch_core
