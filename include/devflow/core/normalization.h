#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace devflow::core {

// Deterministic ASCII-only string utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// fold_state_key produces the lookup key used for workflow state names:
// - ASCII lowercase
// - '-' and '_' are treated as spaces
// - leading/trailing whitespace removed, inner whitespace runs collapsed to one space
// "In-Progress", " in_progress " and "IN  PROGRESS" all fold to "in progress".
inline std::string fold_state_key(const std::string_view input) {
  std::string folded;
  folded.reserve(input.size());

  bool pending_space = false;
  for (const char raw : input) {
    const char ch = (raw == '-' || raw == '_') ? ' ' : raw;
    if (is_ascii_space(ch)) {
      pending_space = !folded.empty();
      continue;
    }
    if (pending_space) {
      folded.push_back(' ');
      pending_space = false;
    }
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      folded.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      folded.push_back(ch);
    }
  }

  return folded;
}

// slugify turns an issue title into a branch-name fragment:
// - ASCII lowercase
// - drops everything except [a-z0-9], whitespace and '-'
// - whitespace runs become '-', repeated '-' collapse, edges trimmed
// - result truncated to max_length (after trimming, so it may end in '-')
inline std::string slugify(const std::string_view text, const std::size_t max_length = 50) {
  std::string slug;
  slug.reserve(text.size());

  for (const char raw : text) {
    char ch = raw;
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch + ('a' - 'A'));
    }
    const bool alnum = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
    if (alnum) {
      slug.push_back(ch);
    } else if (ch == '-' || is_ascii_space(ch)) {
      if (!slug.empty() && slug.back() != '-') {
        slug.push_back('-');
      }
    }
  }

  while (!slug.empty() && slug.back() == '-') {
    slug.pop_back();
  }
  if (slug.size() > max_length) {
    slug.resize(max_length);
  }
  return slug;
}

}  // namespace devflow::core
