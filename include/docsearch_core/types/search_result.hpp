#pragma once

#include <string>

namespace docsearch_core {

struct SearchResult {
  std::string text;
  float relevance = 0.0f;  // cosine similarity clamped to [0, 1]
  int position = 0;
  int word_count = 0;
};

}  // namespace docsearch_core
