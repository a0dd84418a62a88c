#include "docsearch_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "docsearch_core/chunking/text_chunker.hpp"
#include "docsearch_core/llm/hashing_embedding_provider.hpp"
#include "docsearch_core/llm/ollama_client.hpp"
#include "docsearch_core/services/context_assembler.hpp"

namespace docsearch_cli {

namespace {

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid integer for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid integer for " + flag + ": " + value);
  }
}

float parse_float(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    float parsed = std::stof(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

}  // namespace

void CliHandler::validate_overrides(const CliOptions &options) {
  if (options.top_k && *options.top_k <= 0) {
    throw CliError("--top-k must be greater than 0");
  }
  // Written so that NaN fails the check
  if (options.min_similarity &&
      !(*options.min_similarity >= 0.0f && *options.min_similarity <= 1.0f)) {
    throw CliError("--min-similarity must be between 0 and 1");
  }
  if (options.chunk_size && *options.chunk_size <= 0) {
    throw CliError("--chunk-size must be greater than 0");
  }
  if (options.overlap && *options.overlap < 0) {
    throw CliError("--overlap cannot be negative");
  }
}

CliHandler::CliHandler(Config config, ProviderFactory provider_factory, std::ostream &out)
    : config_(std::move(config)), provider_factory_(std::move(provider_factory)), out_(out) {
  if (!provider_factory_) {
    provider_factory_ = &CliHandler::create_embedding_provider;
  }
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "index" || command == "i") {
    options.command = Command::Index;
  } else if (command == "chunks" || command == "c") {
    options.command = Command::Chunks;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "context" || command == "ctx") {
    options.command = Command::Context;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];

    if (flag == "--json") {
      options.json_output = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int(flag, value);
    } else if (flag == "--min-similarity" || flag == "-m") {
      options.min_similarity = parse_float(flag, value);
    } else if (flag == "--chunk-size") {
      options.chunk_size = parse_int(flag, value);
    } else if (flag == "--overlap") {
      options.overlap = parse_int(flag, value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  validate_overrides(options);

  if (options.file_path.empty()) {
    throw CliError("Command " + command + " requires a document. Usage: " + command +
                   " --file <path>");
  }
  if ((options.command == Command::Search || options.command == Command::Context) &&
      options.query.empty()) {
    throw CliError("Command " + command + " requires a query. Usage: " + command +
                   " --file <path> --query <query>");
  }

  return options;
}

Config CliHandler::load_config(const std::string &config_path) {
  if (!config_path.empty()) {
    return Config::from_file(config_path);
  }
  if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
    return Config::from_file(DEFAULT_CONFIG_PATH);
  }
  return Config::from_json(nlohmann::json::object());
}

std::shared_ptr<docsearch_core::EmbeddingProvider> CliHandler::create_embedding_provider(
    const Config &config) {
  if (config.embedding_backend == "hashing") {
    return std::make_shared<docsearch_core::HashingEmbeddingProvider>(
        static_cast<size_t>(config.hashing_dimension));
  }
  return std::make_shared<docsearch_core::OllamaClient>(config.ollama_url, config.embedding_model);
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Index:
      handle_index_command(options);
      break;
    case Command::Chunks:
      handle_chunks_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Context:
      handle_context_command(options);
      break;
    case Command::Help:
    default:
      handle_help_command();
      break;
  }
}

void CliHandler::handle_index_command(const CliOptions &options) {
  bool indexed = false;
  auto retriever = index_file(options, indexed);
  docsearch_core::IndexSummary summary = retriever->summary();

  if (options.json_output) {
    print_json(summary_to_json(summary));
    return;
  }

  if (!indexed) {
    out_ << "Nothing to index in " << options.file_path << std::endl;
    return;
  }
  out_ << "Indexed " << options.file_path << std::endl;
  out_ << "  Chunks: " << summary.chunk_count << std::endl;
  out_ << "  Words: " << summary.total_words << std::endl;
  out_ << "  Dimension: " << summary.dimension << std::endl;
}

void CliHandler::handle_chunks_command(const CliOptions &options) {
  const std::string text = read_document(options.file_path);
  docsearch_core::TextChunker chunker;

  std::vector<docsearch_core::Chunk> chunks;
  try {
    chunks = chunker.split(text, effective_chunk_size(options), effective_overlap(options));
  } catch (const docsearch_core::EmptyInputError &e) {
    std::cerr << "Warning: " << e.what() << std::endl;
  }

  if (options.json_output) {
    nlohmann::json json_chunks = nlohmann::json::array();
    for (const auto &chunk : chunks) {
      json_chunks.push_back(
          {{"position", chunk.position}, {"word_count", chunk.word_count}, {"text", chunk.text}});
    }
    print_json(json_chunks);
    return;
  }

  out_ << chunks.size() << " chunk(s)" << std::endl;
  for (const auto &chunk : chunks) {
    out_ << "#" << chunk.position << " (" << chunk.word_count << " words)" << std::endl;
    out_ << chunk.text << std::endl;
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  bool indexed = false;
  auto retriever = index_file(options, indexed);
  const int top_k = options.top_k.value_or(config_.top_k);
  const float min_similarity = options.min_similarity.value_or(config_.min_similarity);

  std::vector<docsearch_core::SearchResult> results =
      retriever->search(options.query, top_k, min_similarity);

  if (options.json_output) {
    nlohmann::json json_results = nlohmann::json::array();
    for (const auto &result : results) {
      json_results.push_back({{"text", result.text},
                              {"relevance", result.relevance},
                              {"position", result.position},
                              {"word_count", result.word_count}});
    }
    print_json(json_results);
    return;
  }

  if (results.empty()) {
    out_ << "No results above relevance " << std::fixed << std::setprecision(2) << min_similarity
         << std::endl;
    return;
  }

  out_ << "Found " << results.size() << " result(s):" << std::endl;
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    out_ << (i + 1) << ". relevance " << std::fixed << std::setprecision(3) << result.relevance
         << " (position " << result.position << ", " << result.word_count << " words)" << std::endl;
    out_ << "   " << result.text << std::endl;
  }
}

void CliHandler::handle_context_command(const CliOptions &options) {
  bool indexed = false;
  auto retriever = index_file(options, indexed);
  const int top_k = options.top_k.value_or(config_.top_k);
  const float min_similarity = options.min_similarity.value_or(config_.min_similarity);

  std::string context = retriever->generate_context(options.query, top_k, min_similarity);

  if (options.json_output) {
    print_json({{"found", !context.empty()}, {"context", context}});
    return;
  }

  if (context.empty()) {
    out_ << "No relevant context found." << std::endl;
    return;
  }
  out_ << context << std::endl;
}

void CliHandler::handle_help_command() {
  out_ << "Usage: docsearch <command> --file <path> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  index   (i)    Index a document and print its summary\n"
       << "  chunks  (c)    Print the chunks a document splits into\n"
       << "  search  (s)    Rank document chunks against --query\n"
       << "  context (ctx)  Print the assembled context for --query\n"
       << "  help    (h)    Show this message\n"
       << "\n"
       << "Options:\n"
       << "  --file, -f <path>            UTF-8 text document\n"
       << "  --query, -q <text>           Query text\n"
       << "  --config, -c <path>          JSON config (default: " << DEFAULT_CONFIG_PATH << ")\n"
       << "  --top-k, -k <n>              Maximum number of results\n"
       << "  --min-similarity, -m <x>     Relevance floor in [0, 1]\n"
       << "  --chunk-size <n>             Chunk budget in words\n"
       << "  --overlap <n>                Overlap in words (about 10 words per sentence)\n"
       << "  --json                       Print JSON output\n";
  out_.flush();
}

std::unique_ptr<docsearch_core::Retriever> CliHandler::index_file(const CliOptions &options,
                                                                  bool &indexed) {
  const std::string text = read_document(options.file_path);
  auto retriever = std::make_unique<docsearch_core::Retriever>(provider_factory_(config_));

  indexed = retriever->index_document(
      text, effective_chunk_size(options), effective_overlap(options),
      {{"source", options.file_path}, {"characters", text.size()}});
  if (!indexed) {
    std::cerr << "Warning: " << options.file_path << " contains no indexable text" << std::endl;
  }
  return retriever;
}

int CliHandler::effective_chunk_size(const CliOptions &options) const {
  return options.chunk_size.value_or(config_.chunk_size);
}

int CliHandler::effective_overlap(const CliOptions &options) const {
  return options.overlap.value_or(config_.overlap);
}

std::string CliHandler::read_document(const std::string &file_path) {
  std::ifstream file_stream(file_path);
  if (!file_stream.is_open()) {
    throw CliError("Could not open file: " + file_path);
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

nlohmann::json CliHandler::summary_to_json(const docsearch_core::IndexSummary &summary) {
  return {{"chunk_count", summary.chunk_count},
          {"total_words", summary.total_words},
          {"indexed", summary.indexed},
          {"dimension", summary.dimension},
          {"metadata", summary.metadata}};
}

void CliHandler::print_json(const nlohmann::json &value) {
  out_ << value.dump(2) << std::endl;
}

}  // namespace docsearch_cli
