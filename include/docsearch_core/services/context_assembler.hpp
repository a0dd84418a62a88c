#pragma once

#include <string>
#include <vector>

#include "docsearch_core/types/search_result.hpp"

namespace docsearch_core {

/**
 * @brief Renders ranked results as a context block for a language model prompt.
 *
 * Each result becomes:
 *
 *   Fragment <n> (relevance: <pct>%):
 *   <text>
 *   [Position: <position>, Words: <word_count>]
 *
 * Blocks are separated by a line of RULE_WIDTH dashes. Results are rendered in the
 * order given; ranking and filtering belong to the index.
 */
class ContextAssembler {
 public:
  static constexpr size_t RULE_WIDTH = 50;

  // Empty string for no results
  static std::string assemble(const std::vector<SearchResult> &results);

  // relevance * 100, rounded half away from zero
  static long relevance_percent(float relevance);

 private:
  static std::string format_block(size_t sequence_number, const SearchResult &result);
};

}  // namespace docsearch_core
