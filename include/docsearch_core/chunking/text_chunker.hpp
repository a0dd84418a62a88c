#pragma once

#include <exception>
#include <string>
#include <vector>

#include "docsearch_core/chunking/sentence_splitter.hpp"
#include "docsearch_core/types/chunk.hpp"

namespace docsearch_core {

class InvalidConfigError : public std::exception {
 public:
  explicit InvalidConfigError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when a text holds nothing worth indexing. Callers are expected to treat
// this as an ordinary outcome rather than a failure.
class EmptyInputError : public std::exception {
 public:
  explicit EmptyInputError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Groups sentences into overlapping chunks bounded by a word budget.
 *
 * Sentences are never split: a sentence longer than the budget becomes a chunk of
 * its own. After a chunk is closed, the next one is seeded with the last
 * `overlap / 10` sentences of the closed chunk. This approximates an overlap of
 * `overlap` words by assuming roughly ten words per sentence; it is not an exact
 * word-count overlap. The seed is shortened further when it would leave no room
 * for the next sentence, so chunks always move forward and stay within budget.
 */
class TextChunker {
 public:
  static constexpr int MIN_TEXT_LENGTH = 10;
  static constexpr int WORDS_PER_OVERLAP_SENTENCE = 10;

  TextChunker() = default;
  explicit TextChunker(SentenceSplitter splitter);

  std::vector<Chunk> split(const std::string &text, int chunk_size, int overlap) const;

  static void validate_parameters(int chunk_size, int overlap);

 private:
  SentenceSplitter splitter_;
};

}  // namespace docsearch_core
