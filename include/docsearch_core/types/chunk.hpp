#pragma once

#include <string>

namespace docsearch_core {

// A contiguous, sentence-aligned slice of a document. Positions are assigned
// in creation order starting at 0.
struct Chunk {
  std::string text;
  int position = 0;
  int word_count = 0;
};

}  // namespace docsearch_core
