#include "docsearch_core/llm/hashing_embedding_provider.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cmath>
#include <map>

namespace docsearch_core {

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw EmbeddingProviderError("Embedding dimension must be greater than 0");
  }
}

std::vector<std::vector<float>> HashingEmbeddingProvider::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_text(text));
  }
  return vectors;
}

// Bytes >= 0x80 belong to multi-byte UTF-8 sequences and are kept inside tokens,
// so non-Latin words survive tokenisation intact.
std::vector<std::string> HashingEmbeddingProvider::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x80 || std::isalnum(byte)) {
      current.push_back(static_cast<char>(std::tolower(byte)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<float> HashingEmbeddingProvider::embed_text(const std::string &text) const {
  std::vector<float> embedding(dimension_, 0.0f);

  std::map<std::string, int> token_counts;
  for (auto &token : tokenize(text)) {
    token_counts[token]++;
  }
  if (token_counts.empty()) {
    return embedding;
  }

  for (const auto &[token, count] : token_counts) {
    embedding[hash_token(token) % dimension_] += static_cast<float>(count);
  }

  float norm = 0.0f;
  for (float value : embedding) {
    norm += value * value;
  }
  norm = std::sqrt(norm);
  for (float &value : embedding) {
    value /= norm;
  }
  return embedding;
}

uint64_t HashingEmbeddingProvider::hash_token(const std::string &token) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw EmbeddingProviderError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw EmbeddingProviderError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, token.data(), token.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw EmbeddingProviderError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw EmbeddingProviderError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  // First 8 bytes, big-endian
  uint64_t value = 0;
  for (unsigned int i = 0; i < 8 && i < hash_len; ++i) {
    value = (value << 8) | hash[i];
  }
  return value;
}

}  // namespace docsearch_core
