#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

std::vector<float> EmbeddingProvider::get_embedding(const std::string &text) {
  std::vector<std::vector<float>> embeddings = get_embeddings({text});
  if (embeddings.size() != 1) {
    throw EmbeddingProviderError("Expected 1 embedding, provider returned " +
                                 std::to_string(embeddings.size()));
  }
  return std::move(embeddings.front());
}

}  // namespace docsearch_core
