#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

#include "docsearch_core/chunking/text_chunker.hpp"
#include "common/utilities_test.hpp"

namespace docsearch_core {

class TextChunkerTest : public ::testing::Test {
 protected:
  TextChunker chunker_;
  SentenceSplitter splitter_;
};

TEST_F(TextChunkerTest, ClosesChunkWhenBudgetWouldBeExceeded) {
  auto chunks = chunker_.split("Sentence one. Sentence two. Sentence three.", 4, 0);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "Sentence one. Sentence two.");
  EXPECT_EQ(chunks[0].position, 0);
  EXPECT_EQ(chunks[0].word_count, 4);
  EXPECT_EQ(chunks[1].text, "Sentence three.");
  EXPECT_EQ(chunks[1].position, 1);
  EXPECT_EQ(chunks[1].word_count, 2);
}

TEST_F(TextChunkerTest, ShortDocumentFitsInOneChunk) {
  auto chunks = chunker_.split("Sentence one. Sentence two.", 400, 50);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "Sentence one. Sentence two.");
  EXPECT_EQ(chunks[0].word_count, 4);
}

TEST_F(TextChunkerTest, SentencesAreJoinedWithSingleSpaces) {
  auto chunks = chunker_.split("First part here.\n\n   Second part here.", 100, 0);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "First part here. Second part here.");
}

TEST_F(TextChunkerTest, OverlapCarriesTrailingSentences) {
  // overlap 10 ~ one sentence
  auto chunks = chunker_.split("Alpha one. Beta two. Gamma three. Delta four.", 4, 10);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].text, "Alpha one. Beta two.");
  EXPECT_EQ(chunks[1].text, "Beta two. Gamma three.");
  EXPECT_EQ(chunks[2].text, "Gamma three. Delta four.");
  for (const auto &chunk : chunks) {
    EXPECT_EQ(chunk.word_count, 4);
  }
}

TEST_F(TextChunkerTest, OverlapBelowTenWordsCarriesNothing) {
  auto chunks = chunker_.split("Alpha one. Beta two. Gamma three. Delta four.", 4, 9);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "Alpha one. Beta two.");
  EXPECT_EQ(chunks[1].text, "Gamma three. Delta four.");
}

TEST_F(TextChunkerTest, ZeroOverlapProducesDisjointChunks) {
  const std::string text = docsearch_tests::TestUtilities::create_test_document(40);
  auto chunks = chunker_.split(text, 20, 0);

  std::set<std::string> seen;
  for (const auto &chunk : chunks) {
    for (const auto &sentence : splitter_.split(chunk.text)) {
      EXPECT_TRUE(seen.insert(sentence).second) << "sentence repeated: " << sentence;
    }
  }
}

TEST_F(TextChunkerTest, LargeOverlapStillMakesProgress) {
  // overlap 100 asks for ten sentences; a closed chunk only has two to offer
  auto chunks = chunker_.split("Aa one. Bb two. Cc three. Dd four. Ee five. Ff six.", 4, 100);

  ASSERT_EQ(chunks.size(), 5u);
  EXPECT_EQ(chunks[0].text, "Aa one. Bb two.");
  EXPECT_EQ(chunks[4].text, "Ee five. Ff six.");
  for (size_t i = 1; i < chunks.size(); ++i) {
    EXPECT_NE(chunks[i].text, chunks[i - 1].text);
  }
}

TEST_F(TextChunkerTest, OverlapSeedIsShortenedToFitNextSentence) {
  // Carrying "Cc dd." into the second chunk would make it 5 words with a budget of 4
  auto chunks = chunker_.split("Aa bb. Cc dd. Ee ff gg.", 4, 10);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "Aa bb. Cc dd.");
  EXPECT_EQ(chunks[1].text, "Ee ff gg.");
  EXPECT_EQ(chunks[1].word_count, 3);
}

TEST_F(TextChunkerTest, OversizedSentenceBecomesItsOwnChunk) {
  auto chunks = chunker_.split("This single sentence has far more words than allowed. Short one.", 3, 0);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "This single sentence has far more words than allowed.");
  EXPECT_EQ(chunks[0].word_count, 9);
  EXPECT_EQ(chunks[1].text, "Short one.");
}

TEST_F(TextChunkerTest, PositionsAreDenseAndOrdered) {
  const std::string text = docsearch_tests::TestUtilities::create_test_document(60);
  auto chunks = chunker_.split(text, 25, 20);

  ASSERT_GT(chunks.size(), 3u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].position, static_cast<int>(i));
  }
}

TEST_F(TextChunkerTest, ChunksRespectBudgetUnlessSingleSentence) {
  const std::string text = docsearch_tests::TestUtilities::create_test_document(80);

  for (int chunk_size : {5, 12, 30}) {
    for (int overlap : {0, 10, 30, 50}) {
      auto chunks = chunker_.split(text, chunk_size, overlap);
      for (const auto &chunk : chunks) {
        auto sentences = splitter_.split(chunk.text);
        ASSERT_FALSE(sentences.empty());

        // Sentences rejoined reproduce the chunk text exactly
        EXPECT_EQ(docsearch_tests::TestUtilities::join_sentences(sentences), chunk.text);
        EXPECT_EQ(chunk.word_count, count_words(chunk.text));
        if (sentences.size() > 1) {
          EXPECT_LE(chunk.word_count, chunk_size)
              << "chunk_size=" << chunk_size << " overlap=" << overlap;
        }
      }
    }
  }
}

TEST_F(TextChunkerTest, EveryInputSentenceAppearsInSomeChunk) {
  const std::string text = docsearch_tests::TestUtilities::create_test_document(30);
  auto chunks = chunker_.split(text, 15, 20);

  std::set<std::string> covered;
  for (const auto &chunk : chunks) {
    for (const auto &sentence : splitter_.split(chunk.text)) {
      covered.insert(sentence);
    }
  }
  for (const auto &sentence : splitter_.split(text)) {
    EXPECT_EQ(covered.count(sentence), 1u) << sentence;
  }
}

TEST_F(TextChunkerTest, SplittingIsDeterministic) {
  const std::string text = docsearch_tests::TestUtilities::create_test_document(25);
  auto first = chunker_.split(text, 10, 10);
  auto second = chunker_.split(text, 10, 10);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].text, second[i].text);
  }
}

TEST_F(TextChunkerTest, EmptyTextThrowsEmptyInput) {
  EXPECT_THROW(chunker_.split("", 400, 50), EmptyInputError);
}

TEST_F(TextChunkerTest, TextShorterThanTenCharactersThrowsEmptyInput) {
  EXPECT_THROW(chunker_.split("   Hi there   ", 400, 50), EmptyInputError);
  EXPECT_THROW(chunker_.split(" \n\t  \n ", 400, 50), EmptyInputError);
}

TEST_F(TextChunkerTest, LengthCheckCountsCharactersNotBytes) {
  // Nine characters, sixteen bytes
  EXPECT_THROW(chunker_.split("Ошибка д.", 400, 50), EmptyInputError);
  EXPECT_NO_THROW(chunker_.split("Ошибка нет.", 400, 50));
}

TEST_F(TextChunkerTest, NonPositiveChunkSizeIsRejected) {
  EXPECT_THROW(chunker_.split("Sentence one. Sentence two.", 0, 0), InvalidConfigError);
  EXPECT_THROW(chunker_.split("Sentence one. Sentence two.", -5, 0), InvalidConfigError);
}

TEST_F(TextChunkerTest, NegativeOverlapIsRejected) {
  EXPECT_THROW(chunker_.split("Sentence one. Sentence two.", 10, -1), InvalidConfigError);
}

TEST_F(TextChunkerTest, ConfigurationIsValidatedBeforeInput) {
  EXPECT_THROW(chunker_.split("", 0, 0), InvalidConfigError);
}

}  // namespace docsearch_core
