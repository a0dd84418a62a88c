#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace docsearch_cli {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

class Config {
 public:
  std::string embedding_backend;
  std::string ollama_url;
  std::string embedding_model;
  int hashing_dimension;

  // Retrieval parameters
  int chunk_size;
  int overlap;
  int top_k;
  float min_similarity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    config.embedding_backend = value_or(json_config, "embedding_backend", std::string("ollama"));
    config.ollama_url = value_or(json_config, "ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = value_or(json_config, "embedding_model", std::string("all-minilm"));
    config.hashing_dimension = value_or(json_config, "hashing_dimension", 256);

    config.chunk_size = value_or(json_config, "chunk_size", 400);
    config.overlap = value_or(json_config, "overlap", 50);
    config.top_k = value_or(json_config, "top_k", 3);
    config.min_similarity = value_or(json_config, "min_similarity", 0.3f);

    config.validate();
    return config;
  }

  nlohmann::json to_json() const {
    return {{"embedding_backend", embedding_backend},
            {"ollama_url", ollama_url},
            {"embedding_model", embedding_model},
            {"hashing_dimension", hashing_dimension},
            {"chunk_size", chunk_size},
            {"overlap", overlap},
            {"top_k", top_k},
            {"min_similarity", min_similarity}};
  }

  void validate() const {
    if (embedding_backend != "ollama" && embedding_backend != "hashing") {
      throw ConfigError("embedding_backend must be \"ollama\" or \"hashing\", got \"" +
                        embedding_backend + "\"");
    }
    if (embedding_backend == "ollama") {
      if (ollama_url.empty()) {
        throw ConfigError("ollama_url cannot be empty");
      }
      if (embedding_model.empty()) {
        throw ConfigError("embedding_model cannot be empty");
      }
    }
    if (hashing_dimension <= 0) {
      throw ConfigError("hashing_dimension must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw ConfigError("chunk_size must be greater than 0");
    }
    if (overlap < 0) {
      throw ConfigError("overlap cannot be negative");
    }
    if (top_k <= 0) {
      throw ConfigError("top_k must be greater than 0");
    }
    if (min_similarity < 0.0f || min_similarity > 1.0f) {
      throw ConfigError("min_similarity must be between 0 and 1");
    }
  }

 private:
  // Missing keys and values of the wrong type fall back to the default
  template <typename T>
  static T value_or(const nlohmann::json &json_config, const char *key, T fallback) {
    auto it = json_config.find(key);
    if (it == json_config.end()) {
      return fallback;
    }
    try {
      return it->get<T>();
    } catch (const nlohmann::json::exception &) {
      return fallback;
    }
  }
};

}  // namespace docsearch_cli
