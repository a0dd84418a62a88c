#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace docsearch_core {

class EmbeddingProviderError : public std::exception {
 public:
  explicit EmbeddingProviderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Turns text into fixed-dimension vectors. Implementations must return one vector
 * per input, in input order, and every vector they produce must have the same
 * dimension. A call may block (network or heavy local compute); failures are
 * reported as EmbeddingProviderError and are never retried by the caller.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Embeds a whole batch in a single round trip
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;

  // Embeds a single text, by default as a batch of one
  virtual std::vector<float> get_embedding(const std::string &text);
};

using EmbeddingProviderPtr = std::shared_ptr<EmbeddingProvider>;

}  // namespace docsearch_core
