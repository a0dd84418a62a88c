#include "docsearch_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <sstream>

namespace docsearch_core {

namespace {

struct BufferedSentence {
  std::string text;
  int word_count;
};

Chunk close_chunk(const std::vector<BufferedSentence> &buffer, int position, int word_count) {
  std::ostringstream joined;
  for (size_t i = 0; i < buffer.size(); ++i) {
    if (i > 0) {
      joined << ' ';
    }
    joined << buffer[i].text;
  }
  return {.text = joined.str(), .position = position, .word_count = word_count};
}

}  // namespace

TextChunker::TextChunker(SentenceSplitter splitter) : splitter_(std::move(splitter)) {}

void TextChunker::validate_parameters(int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw InvalidConfigError("chunk_size must be greater than 0, got " + std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw InvalidConfigError("overlap cannot be negative, got " + std::to_string(overlap));
  }
}

std::vector<Chunk> TextChunker::split(const std::string &text, int chunk_size, int overlap) const {
  validate_parameters(chunk_size, overlap);

  const std::string trimmed = trim_unicode(text);
  if (utf8::distance(trimmed.begin(), trimmed.end()) < MIN_TEXT_LENGTH) {
    throw EmptyInputError("Text is too short to index (fewer than " +
                          std::to_string(MIN_TEXT_LENGTH) + " characters)");
  }

  const std::vector<std::string> sentences = splitter_.split(trimmed);
  if (sentences.empty()) {
    throw EmptyInputError("Text contains no sentences");
  }

  const size_t overlap_sentences = static_cast<size_t>(overlap / WORDS_PER_OVERLAP_SENTENCE);

  std::vector<Chunk> chunks;
  std::vector<BufferedSentence> buffer;
  int current_words = 0;

  for (const auto &sentence : sentences) {
    const int sentence_words = count_words(sentence);

    if (current_words + sentence_words > chunk_size && !buffer.empty()) {
      chunks.push_back(close_chunk(buffer, static_cast<int>(chunks.size()), current_words));

      // Carry the tail of the closed chunk, but never the whole of it.
      const size_t keep = std::min(overlap_sentences, buffer.size() - 1);
      std::vector<BufferedSentence> seed(buffer.end() - static_cast<long>(keep), buffer.end());
      int seed_words = 0;
      for (const auto &seeded : seed) {
        seed_words += seeded.word_count;
      }
      while (!seed.empty() && seed_words + sentence_words > chunk_size) {
        seed_words -= seed.front().word_count;
        seed.erase(seed.begin());
      }

      buffer = std::move(seed);
      current_words = seed_words;
    }

    buffer.push_back({sentence, sentence_words});
    current_words += sentence_words;
  }

  if (!buffer.empty()) {
    chunks.push_back(close_chunk(buffer, static_cast<int>(chunks.size()), current_words));
  }

  return chunks;
}

}  // namespace docsearch_core
