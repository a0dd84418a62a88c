#pragma once

#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

class OllamaError : public EmbeddingProviderError {
 public:
  explicit OllamaError(const std::string &message) : EmbeddingProviderError(message) {}
};

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws OllamaError when no server answers at ollama_url
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // All texts go out in one /api/embed request
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  virtual bool is_server_available();

  const std::string &embedding_model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace docsearch_core
