#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsearch_cli/config.hpp"
#include "docsearch_core/llm/embedding_provider.hpp"
#include "docsearch_core/services/retriever.hpp"

namespace docsearch_cli {

enum class Command { Index, Chunks, Search, Context, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  std::string query;
  std::string config_path;
  std::optional<int> top_k;
  std::optional<float> min_similarity;
  std::optional<int> chunk_size;
  std::optional<int> overlap;
  bool json_output = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

using ProviderFactory =
    std::function<std::shared_ptr<docsearch_core::EmbeddingProvider>(const Config &)>;

class CliHandler {
 public:
  static constexpr const char *DEFAULT_CONFIG_PATH = "docsearchrc.json";

  // An empty factory selects the backend named in the config
  explicit CliHandler(Config config, ProviderFactory provider_factory = {}, std::ostream &out = std::cout);

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  static CliOptions parse_arguments(int argc, char *argv[]);

  // Applies the same ranges as Config::validate to command line overrides
  static void validate_overrides(const CliOptions &options);

  // Uses config_path when given, else DEFAULT_CONFIG_PATH if present, else defaults
  static Config load_config(const std::string &config_path);

  static std::shared_ptr<docsearch_core::EmbeddingProvider> create_embedding_provider(
      const Config &config);

  void execute_command(const CliOptions &options);

  const Config &config() const {
    return config_;
  }

 private:
  Config config_;
  ProviderFactory provider_factory_;
  std::ostream &out_;

  // Command handlers
  void handle_index_command(const CliOptions &options);
  void handle_chunks_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_context_command(const CliOptions &options);
  void handle_help_command();

  // Helper methods
  std::unique_ptr<docsearch_core::Retriever> index_file(const CliOptions &options, bool &indexed);
  int effective_chunk_size(const CliOptions &options) const;
  int effective_overlap(const CliOptions &options) const;
  static std::string read_document(const std::string &file_path);
  static nlohmann::json summary_to_json(const docsearch_core::IndexSummary &summary);
  void print_json(const nlohmann::json &value);
};

}  // namespace docsearch_cli
