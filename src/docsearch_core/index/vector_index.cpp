#include "docsearch_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>

namespace docsearch_core {

namespace {

struct RankedCandidate {
  float relevance;
  int row;
};

float to_relevance(float score) {
  return std::clamp(score, 0.0f, 1.0f);
}

bool all_finite(const std::vector<float> &vector) {
  return std::all_of(vector.begin(), vector.end(), [](float value) { return std::isfinite(value); });
}

}  // namespace

VectorIndex::VectorIndex(std::vector<Chunk> chunks, const std::vector<std::vector<float>> &vectors)
    : chunks_(std::move(chunks)), dimension_(0) {
  if (chunks_.empty()) {
    throw EmptyDocumentError("Cannot build an index from zero chunks");
  }
  if (vectors.size() != chunks_.size()) {
    throw VectorIndexError("Vector count mismatch. Expected " + std::to_string(chunks_.size()) +
                           ", got " + std::to_string(vectors.size()));
  }

  dimension_ = vectors.front().size();
  if (dimension_ == 0) {
    throw VectorIndexError("Embedding vectors cannot be empty");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension_);
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension_) {
      throw VectorIndexError("Vector dimension mismatch at chunk " + std::to_string(i) +
                             ". Expected " + std::to_string(dimension_) + ", got " +
                             std::to_string(vectors[i].size()));
    }
    if (!all_finite(vectors[i])) {
      throw VectorIndexError("Vector at chunk " + std::to_string(i) + " has a non-finite component");
    }
    all_vectors_flat.insert(all_vectors_flat.end(), vectors[i].begin(), vectors[i].end());
  }

  // Unit vectors turn inner product into cosine similarity; zero vectors stay zero
  faiss::fvec_renorm_L2(dimension_, vectors.size(), all_vectors_flat.data());

  faiss_index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension_));
  faiss_index_->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
}

VectorIndex::~VectorIndex() = default;

std::unique_ptr<VectorIndex> VectorIndex::build(std::vector<Chunk> chunks, EmbeddingProvider &embedder) {
  if (chunks.empty()) {
    throw EmptyDocumentError("Cannot build an index from zero chunks");
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }

  std::vector<std::vector<float>> vectors = embedder.get_embeddings(texts);
  if (vectors.size() != texts.size()) {
    throw EmbeddingProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " texts");
  }

  return std::make_unique<VectorIndex>(std::move(chunks), vectors);
}

std::vector<SearchResult> VectorIndex::search(const std::vector<float> &query_vector,
                                              int top_k,
                                              float min_similarity) const {
  if (top_k <= 0) {
    return {};
  }
  validate_query(query_vector);

  std::vector<float> query(query_vector);
  faiss::fvec_renorm_L2(dimension_, 1, query.data());

  // Score every chunk; truncation happens after the deterministic re-sort below
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> scores(static_cast<size_t>(total));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(total));
  faiss_index_->search(1, query.data(), total, scores.data(), labels.data());

  std::vector<RankedCandidate> candidates;
  candidates.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0) {
      continue;
    }
    candidates.push_back({to_relevance(scores[i]), static_cast<int>(labels[i])});
  }

  std::sort(candidates.begin(), candidates.end(),
            [this](const RankedCandidate &lhs, const RankedCandidate &rhs) {
              if (lhs.relevance != rhs.relevance) {
                return lhs.relevance > rhs.relevance;
              }
              return chunks_[static_cast<size_t>(lhs.row)].position <
                     chunks_[static_cast<size_t>(rhs.row)].position;
            });

  std::vector<SearchResult> results;
  for (const auto &candidate : candidates) {
    // Everything after the first candidate below the floor is no better
    if (candidate.relevance < min_similarity) {
      break;
    }
    const Chunk &chunk = chunks_[static_cast<size_t>(candidate.row)];
    results.push_back({.text = chunk.text,
                       .relevance = candidate.relevance,
                       .position = chunk.position,
                       .word_count = chunk.word_count});
    if (static_cast<int>(results.size()) >= top_k) {
      break;
    }
  }
  return results;
}

int VectorIndex::total_words() const {
  int total = 0;
  for (const auto &chunk : chunks_) {
    total += chunk.word_count;
  }
  return total;
}

void VectorIndex::validate_query(const std::vector<float> &query_vector) const {
  if (query_vector.size() != dimension_) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " +
                           std::to_string(query_vector.size()));
  }
  if (!all_finite(query_vector)) {
    throw VectorIndexError("Query vector has a non-finite component");
  }
}

}  // namespace docsearch_core
