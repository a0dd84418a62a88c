#include "docsearch_core/services/context_assembler.hpp"

#include <cmath>
#include <sstream>

namespace docsearch_core {

std::string ContextAssembler::assemble(const std::vector<SearchResult> &results) {
  if (results.empty()) {
    return "";
  }

  const std::string rule(RULE_WIDTH, '-');
  std::ostringstream context;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      context << '\n' << rule << '\n';
    }
    context << format_block(i + 1, results[i]);
  }
  return context.str();
}

long ContextAssembler::relevance_percent(float relevance) {
  return std::lround(static_cast<double>(relevance) * 100.0);
}

std::string ContextAssembler::format_block(size_t sequence_number, const SearchResult &result) {
  std::ostringstream block;
  block << "Fragment " << sequence_number << " (relevance: " << relevance_percent(result.relevance)
        << "%):\n"
        << result.text << '\n'
        << "[Position: " << result.position << ", Words: " << result.word_count << ']';
  return block.str();
}

}  // namespace docsearch_core
