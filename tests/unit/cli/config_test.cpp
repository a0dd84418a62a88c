#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "docsearch_cli/config.hpp"
#include "common/utilities_test.hpp"

namespace docsearch_cli {

using docsearch_tests::TestUtilities;

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"embedding_backend", "ollama"},
                      {"ollama_url", "http://ollama.internal:11434"},
                      {"embedding_model", "nomic-embed-text"},
                      {"chunk_size", 200},
                      {"overlap", 20},
                      {"top_k", 5},
                      {"min_similarity", 0.5}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.embedding_backend, "ollama");
  EXPECT_EQ(cfg.ollama_url, "http://ollama.internal:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.chunk_size, 200);
  EXPECT_EQ(cfg.overlap, 20);
  EXPECT_EQ(cfg.top_k, 5);
  EXPECT_FLOAT_EQ(cfg.min_similarity, 0.5f);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.embedding_backend, "ollama");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "all-minilm");
  EXPECT_EQ(cfg.hashing_dimension, 256);
  EXPECT_EQ(cfg.chunk_size, 400);
  EXPECT_EQ(cfg.overlap, 50);
  EXPECT_EQ(cfg.top_k, 3);
  EXPECT_FLOAT_EQ(cfg.min_similarity, 0.3f);
}

TEST(ConfigTest, WrongTypesFallBackToDefaults) {
  Config cfg = Config::from_json({{"chunk_size", "big"}, {"top_k", nullptr}});

  EXPECT_EQ(cfg.chunk_size, 400);
  EXPECT_EQ(cfg.top_k, 3);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "embedding_backend": "hashing",
    "hashing_dimension": 128,
    "chunk_size": 120,
    "overlap": 0
  })JSON";

  auto path = TestUtilities::write_temp_file(contents, ".json");
  Config cfg;
  try {
    cfg = Config::from_file(path.string());
  } catch (const std::exception &) {
    TestUtilities::remove_file(path);
    throw;
  }
  TestUtilities::remove_file(path);

  EXPECT_EQ(cfg.embedding_backend, "hashing");
  EXPECT_EQ(cfg.hashing_dimension, 128);
  EXPECT_EQ(cfg.chunk_size, 120);
  EXPECT_EQ(cfg.overlap, 0);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/docsearchrc.json"); }, ConfigError);
}

TEST(ConfigTest, MalformedJsonThrows) {
  auto path = TestUtilities::write_temp_file("{ not json", ".json");
  EXPECT_THROW({ (void)Config::from_file(path.string()); }, ConfigError);
  TestUtilities::remove_file(path);
}

TEST(ConfigTest, NonObjectJsonThrows) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::array({1, 2})); }, ConfigError);
}

TEST(ConfigTest, UnknownBackendThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"embedding_backend", "openai"}}); }, ConfigError);
}

TEST(ConfigTest, EmptyOllamaFieldsThrowOnlyForOllamaBackend) {
  EXPECT_THROW({ (void)Config::from_json({{"ollama_url", ""}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"embedding_model", ""}}); }, ConfigError);
  EXPECT_NO_THROW(
      { (void)Config::from_json({{"embedding_backend", "hashing"}, {"embedding_model", ""}}); });
}

TEST(ConfigTest, OutOfRangeRetrievalParametersThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"chunk_size", 0}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"overlap", -1}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"top_k", 0}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"min_similarity", 1.5}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"min_similarity", -0.1}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"hashing_dimension", 0}}); }, ConfigError);
}

TEST(ConfigTest, ToJsonRoundTripsThroughFromJson) {
  Config original = Config::from_json({{"embedding_backend", "hashing"}, {"top_k", 7}});

  Config copy = Config::from_json(original.to_json());

  EXPECT_EQ(copy.embedding_backend, "hashing");
  EXPECT_EQ(copy.top_k, 7);
  EXPECT_EQ(copy.chunk_size, original.chunk_size);
}

}  // namespace docsearch_cli
