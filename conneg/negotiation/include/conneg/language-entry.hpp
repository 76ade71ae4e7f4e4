#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/specificity.hpp"

namespace conneg {

// Preference entry of Accept-Language, for instance 'en-US;q=0.8'.
struct LanguageEntry {
  std::string_view primary;    // 'en'
  std::string_view extension;  // 'US', may be empty
  std::string_view full;       // 'en-US', or 'en' when there is no extension
  double quality{};
  int32_t order{};

  bool operator==(const LanguageEntry &) const noexcept = default;
};

// Parse one header segment of the form: primary ['-' extension] OWS [';' params].
// The primary tag holds neither whitespace, '-' nor ';'. The extension may hold '-' (as in 'zh-Hant-TW').
[[nodiscard]] std::optional<LanguageEntry> ParseLanguageEntry(std::string_view segment, int32_t order);

// Score a candidate language (parsed with ParseLanguageEntry) against a preference entry:
//  - 4: same full tag
//  - 2: the entry primary tag is the candidate full tag (entry 'en-US' vs candidate 'en')
//  - 1: the entry full tag is the candidate primary tag (entry 'en' vs candidate 'en-US')
//  - 0: the entry is the '*' wildcard
// Comparisons are case-insensitive. Any other combination does not match.
[[nodiscard]] std::optional<Specificity> SpecifyLanguage(const LanguageEntry &candidate, const LanguageEntry &entry,
                                                         int32_t candidateOrder) noexcept;

}  // namespace conneg
