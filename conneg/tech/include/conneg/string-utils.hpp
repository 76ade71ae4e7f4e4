#pragma once

#include <string_view>

namespace conneg {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

// OWS per RFC7230: SP and HTAB only.
constexpr bool IsOws(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Any ASCII whitespace, used by the header grammars to delimit tokens.
constexpr bool IsSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && IsOws(*begin)) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (!IsOws(*end)) {
      ++end;
      break;
    }
  }
  return {begin, end};
}

constexpr std::string_view SkipSpaces(std::string_view sv) noexcept {
  while (!sv.empty() && IsSpace(sv.front())) {
    sv.remove_prefix(1);
  }
  return sv;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

}  // namespace conneg
