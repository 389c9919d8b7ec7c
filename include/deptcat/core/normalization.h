#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace deptcat::core {

// Deterministic text helpers for department names.
// Case folding is ASCII-only (A-Z -> a-z via explicit char math, no std::tolower),
// which matches SQLite's NOCASE collation used by the storage layer.
// Non-ASCII bytes are preserved unchanged.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
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
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

// is_blank is true for an empty string or a string made only of whitespace.
inline bool is_blank(const std::string_view input) {
  for (const char ch : input) {
    if (!is_ascii_space(ch)) {
      return false;
    }
  }
  return true;
}

// trim removes leading and trailing ASCII whitespace.
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

// utf8_length counts code points: every byte that is not a continuation byte (10xxxxxx).
// Field limits are expressed in characters, not bytes.
inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

// is_valid_utf8 rejects truncated sequences, stray continuation bytes, overlong forms,
// surrogates and code points above U+10FFFF.
inline bool is_valid_utf8(const std::string_view input) {
  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (lead < 0x80U) {
      ++i;
      continue;
    }

    std::size_t extra = 0;
    unsigned char min_next = 0x80U;
    unsigned char max_next = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
      extra = 1;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      extra = 2;
      if (lead == 0xE0U) {
        min_next = 0xA0U;
      } else if (lead == 0xEDU) {
        max_next = 0x9FU;
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      extra = 3;
      if (lead == 0xF0U) {
        min_next = 0x90U;
      } else if (lead == 0xF4U) {
        max_next = 0x8FU;
      }
    } else {
      return false;
    }

    if (input.size() - i <= extra) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(input[i + k]);
      const unsigned char lo = k == 1 ? min_next : 0x80U;
      const unsigned char hi = k == 1 ? max_next : 0xBFU;
      if (next < lo || next > hi) {
        return false;
      }
    }
    i += extra + 1;
  }
  return true;
}

inline bool equals_ignore_case(const std::string_view a, const std::string_view b) {
  return normalize_ascii_lower(a) == normalize_ascii_lower(b);
}

// contains_ignore_case is true when needle occurs in haystack under ASCII case folding.
inline bool contains_ignore_case(const std::string_view haystack, const std::string_view needle) {
  return normalize_ascii_lower(haystack).find(normalize_ascii_lower(needle)) != std::string::npos;
}

}  // namespace deptcat::core
