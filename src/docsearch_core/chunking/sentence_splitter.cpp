#include "docsearch_core/chunking/sentence_splitter.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace docsearch_core {

namespace {

bool is_cjk_terminator(uint32_t cp) {
  return cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F;  // 。！？
}

bool is_terminator(uint32_t cp) {
  return cp == '.' || cp == '!' || cp == '?' || cp == 0x2026 || is_cjk_terminator(cp);
}

// Closing punctuation that stays attached to the sentence it closes.
bool is_closing(uint32_t cp) {
  switch (cp) {
    case '"':
    case '\'':
    case ')':
    case ']':
    case '}':
    case 0x00BB:  // »
    case 0x2019:  // ’
    case 0x201D:  // ”
    case 0x300D:  // 」
    case 0xFF09:  // ）
      return true;
    default:
      return false;
  }
}

std::string sanitize_utf8(const std::string &text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string clean;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
  return clean;
}

// Single-letter initials ("j") and tokens such as "e.g", "i.e" or "u.s": single
// letters separated by periods.
bool is_initialism(const std::string &token) {
  size_t segment_length = 0;
  for (char c : token) {
    if (c == '.') {
      if (segment_length != 1) {
        return false;
      }
      segment_length = 0;
    } else if (std::isalpha(static_cast<unsigned char>(c))) {
      ++segment_length;
    } else {
      return false;
    }
  }
  return segment_length == 1;
}

}  // namespace

bool is_unicode_space(char32_t code_point) {
  switch (code_point) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
    case 0x0085:
    case 0x00A0:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x3000:
      return true;
    default:
      return code_point >= 0x2000 && code_point <= 0x200A;
  }
}

std::string trim_unicode(const std::string &raw) {
  const std::string text = sanitize_utf8(raw);
  size_t first = std::string::npos;
  size_t last = 0;

  auto it = text.begin();
  while (it != text.end()) {
    const size_t offset = static_cast<size_t>(it - text.begin());
    const uint32_t cp = utf8::next(it, text.end());
    if (!is_unicode_space(cp)) {
      if (first == std::string::npos) {
        first = offset;
      }
      last = static_cast<size_t>(it - text.begin());
    }
  }

  if (first == std::string::npos) {
    return "";
  }
  return text.substr(first, last - first);
}

int count_words(const std::string &raw) {
  const std::string text = sanitize_utf8(raw);
  int words = 0;
  bool in_word = false;
  auto it = text.begin();
  while (it != text.end()) {
    const uint32_t cp = utf8::next(it, text.end());
    if (is_unicode_space(cp)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

SentenceSplitter::SentenceSplitter() : abbreviations_(default_abbreviations()) {}

SentenceSplitter::SentenceSplitter(std::unordered_set<std::string> abbreviations)
    : abbreviations_(std::move(abbreviations)) {}

std::unordered_set<std::string> SentenceSplitter::default_abbreviations() {
  return {"mr",  "mrs",  "ms",   "dr",   "prof", "sr",  "jr",  "st",  "mt",  "vs",
          "approx", "dept", "est", "fig", "figs", "inc", "ltd", "co",  "corp", "vol",
          "pp",  "ed",   "eds",  "cf",   "al",   "gen", "col", "lt",  "sgt", "capt",
          "rev", "hon",  "gov",  "sen",  "jan",  "feb", "apr", "jun", "jul", "aug",
          "sep", "sept", "oct",  "nov",  "dec", "etc"};
}

bool SentenceSplitter::is_abbreviation(const std::string &token) const {
  std::string lowered;
  lowered.reserve(token.size());
  for (char c : token) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  while (!lowered.empty() && lowered.back() == '.') {
    lowered.pop_back();
  }
  if (lowered.empty()) {
    return false;
  }
  return abbreviations_.count(lowered) > 0 || is_initialism(lowered);
}

bool SentenceSplitter::ends_with_abbreviation(const std::string &text, size_t period_offset) const {
  // Walk back by code point so non-breaking spaces also delimit the token
  const auto period = text.begin() + static_cast<long>(period_offset);
  auto start = period;
  while (start != text.begin()) {
    auto previous = start;
    if (is_unicode_space(utf8::prior(previous, text.begin()))) {
      break;
    }
    start = previous;
  }
  std::string token(start, period);

  // Drop opening punctuation: "(Dr." or "\"Mr." still count.
  const auto opening = token.find_first_not_of("([{\"'");
  if (opening == std::string::npos) {
    return false;
  }
  token.erase(0, opening);
  return is_abbreviation(token);
}

std::vector<std::string> SentenceSplitter::split(const std::string &raw) const {
  const std::string text = sanitize_utf8(raw);
  std::vector<std::string> sentences;

  const auto begin = text.begin();
  const auto end = text.end();
  size_t sentence_start = 0;

  auto emit = [&](size_t stop) {
    std::string sentence = trim_unicode(text.substr(sentence_start, stop - sentence_start));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    sentence_start = stop;
  };

  auto it = begin;
  while (it != end) {
    const auto terminator_pos = it;
    const uint32_t cp = utf8::next(it, end);
    if (!is_terminator(cp)) {
      continue;
    }

    // Absorb runs such as "?!" or "..." and any closing quotes/brackets.
    bool cjk = is_cjk_terminator(cp);
    size_t run_length = 1;
    auto cursor = it;
    while (cursor != end) {
      auto peek = cursor;
      const uint32_t next = utf8::next(peek, end);
      if (!is_terminator(next)) {
        break;
      }
      cjk = cjk || is_cjk_terminator(next);
      ++run_length;
      cursor = peek;
    }
    while (cursor != end) {
      auto peek = cursor;
      if (!is_closing(utf8::next(peek, end))) {
        break;
      }
      cursor = peek;
    }

    bool at_boundary = (cursor == end) || cjk;
    if (!at_boundary) {
      auto peek = cursor;
      at_boundary = is_unicode_space(utf8::next(peek, end));
    }
    if (at_boundary && cp == '.' && run_length == 1 &&
        ends_with_abbreviation(text, static_cast<size_t>(terminator_pos - begin))) {
      at_boundary = false;
    }

    if (at_boundary) {
      emit(static_cast<size_t>(cursor - begin));
    }
    it = cursor;
  }

  emit(text.size());
  return sentences;
}

}  // namespace docsearch_core
