#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace docsearch_core {

/**
 * @brief Splits UTF-8 text into sentences.
 *
 * A sentence ends at '.', '!', '?', the ellipsis character or a CJK full stop,
 * followed by any closing quotes/brackets and then whitespace (or the end of the
 * text). Known abbreviations ("Dr.", "etc.", ...), single-letter initials ("J."),
 * dotted initialisms ("e.g.") and decimal numbers do not end a sentence. Returned sentences are trimmed and never empty.
 */
class SentenceSplitter {
 public:
  SentenceSplitter();
  explicit SentenceSplitter(std::unordered_set<std::string> abbreviations);

  std::vector<std::string> split(const std::string &text) const;

  bool is_abbreviation(const std::string &token) const;

  static std::unordered_set<std::string> default_abbreviations();

 private:
  std::unordered_set<std::string> abbreviations_;

  bool ends_with_abbreviation(const std::string &text, size_t period_offset) const;
};

// Whitespace helpers shared by the chunker and the splitter. Both operate on
// code points, so non-breaking and ideographic spaces count as whitespace.
bool is_unicode_space(char32_t code_point);
std::string trim_unicode(const std::string &text);
int count_words(const std::string &text);

}  // namespace docsearch_core
