#include "docsearch_core/services/retriever.hpp"

#include <stdexcept>

#include "docsearch_core/services/context_assembler.hpp"

namespace docsearch_core {

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider)
    : embedding_provider_(std::move(embedding_provider)) {
  if (!embedding_provider_) {
    throw std::invalid_argument("Retriever requires an embedding provider");
  }
}

bool Retriever::index_document(const std::string &text,
                               int chunk_size,
                               int overlap,
                               const nlohmann::json &metadata) {
  std::vector<Chunk> chunks;
  try {
    chunks = chunker_.split(text, chunk_size, overlap);
  } catch (const EmptyInputError &) {
    // A new document always discards the old one, even when it yields nothing
    publish(nullptr);
    return false;
  }

  // Built off to the side; searches keep using the previous document until publish,
  // and a provider failure leaves it in place
  auto document = std::make_shared<IndexedDocument>();
  try {
    document->index = VectorIndex::build(std::move(chunks), *embedding_provider_);
  } catch (const EmptyDocumentError &) {
    publish(nullptr);
    return false;
  }
  document->metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

  publish(std::move(document));
  return true;
}

std::vector<SearchResult> Retriever::search(const std::string &query,
                                            int top_k,
                                            float min_similarity) const {
  const auto document = current_document();
  if (!document) {
    return {};
  }

  const std::vector<float> query_vector = embedding_provider_->get_embedding(query);
  return document->index->search(query_vector, top_k, min_similarity);
}

std::string Retriever::generate_context(const std::string &query,
                                        int top_k,
                                        float min_similarity) const {
  return ContextAssembler::assemble(search(query, top_k, min_similarity));
}

IndexSummary Retriever::summary() const {
  IndexSummary summary;
  const auto document = current_document();
  if (!document) {
    return summary;
  }

  summary.chunk_count = static_cast<int>(document->index->size());
  summary.total_words = document->index->total_words();
  summary.indexed = true;
  summary.dimension = document->index->dimension();
  summary.metadata = document->metadata;
  return summary;
}

void Retriever::clear() {
  publish(nullptr);
}

std::shared_ptr<const Retriever::IndexedDocument> Retriever::current_document() const {
  std::lock_guard<std::mutex> lock(document_mutex_);
  return document_;
}

void Retriever::publish(std::shared_ptr<const IndexedDocument> document) {
  std::shared_ptr<const IndexedDocument> previous;
  {
    std::lock_guard<std::mutex> lock(document_mutex_);
    previous = std::move(document_);
    document_ = std::move(document);
  }
  // previous is released outside the lock
}

}  // namespace docsearch_core
