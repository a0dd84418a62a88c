#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

/**
 * @brief Deterministic, offline embedding provider.
 *
 * Lower-cases the text, splits it into alphanumeric tokens and hashes every token
 * with SHA-256 into one of `dimension` buckets (feature hashing). Bucket counts are
 * L2-normalised. Texts sharing vocabulary get similar vectors; a text with no
 * tokens maps to the zero vector. No model is involved, which makes it suitable for
 * tests and for running without an embedding server.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 256;

  explicit HashingEmbeddingProvider(size_t dimension = DEFAULT_DIMENSION);

  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  size_t dimension() const {
    return dimension_;
  }

  static std::vector<std::string> tokenize(const std::string &text);

 private:
  size_t dimension_;

  std::vector<float> embed_text(const std::string &text) const;
  static uint64_t hash_token(const std::string &token);
};

}  // namespace docsearch_core
