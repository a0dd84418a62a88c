#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_provider.hpp"
#include "docsearch_core/types/chunk.hpp"
#include "docsearch_core/types/search_result.hpp"

namespace faiss {
struct IndexFlatIP;
}

namespace docsearch_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when there is nothing to index. Like EmptyInputError this is an expected
// outcome, not a failure.
class EmptyDocumentError : public std::exception {
 public:
  explicit EmptyDocumentError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Immutable in-memory index of one document's chunks and their vectors.
 *
 * chunks()[i] corresponds to the i-th stored vector. Search is exact cosine
 * similarity over every chunk: vectors are stored L2-normalised in a flat
 * inner-product Faiss index. An index is never modified after construction, so
 * concurrent searches need no synchronisation.
 */
class VectorIndex {
 public:
  // Throws EmptyDocumentError for no chunks and VectorIndexError when vectors and
  // chunks disagree in count, the vectors disagree in dimension or a component is
  // NaN or infinite.
  VectorIndex(std::vector<Chunk> chunks, const std::vector<std::vector<float>> &vectors);
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Embeds every chunk text with a single provider call, then builds the index
  static std::unique_ptr<VectorIndex> build(std::vector<Chunk> chunks, EmbeddingProvider &embedder);

  /**
   * Ranks every chunk by relevance (descending, ties by ascending position), then
   * returns the leading run of results whose relevance is at least min_similarity,
   * truncated to top_k. Returns an empty vector when nothing clears the floor or
   * top_k <= 0.
   */
  std::vector<SearchResult> search(const std::vector<float> &query_vector,
                                   int top_k,
                                   float min_similarity) const;

  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }
  size_t size() const {
    return chunks_.size();
  }
  size_t dimension() const {
    return dimension_;
  }
  int total_words() const;

 private:
  std::vector<Chunk> chunks_;
  size_t dimension_;
  std::unique_ptr<faiss::IndexFlatIP> faiss_index_;

  void validate_query(const std::vector<float> &query_vector) const;
};

}  // namespace docsearch_core
