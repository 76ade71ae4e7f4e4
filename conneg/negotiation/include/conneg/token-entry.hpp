#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/specificity.hpp"

namespace conneg {

// Preference entry of the single token dimensions (Accept-Charset, Accept-Encoding).
struct TokenEntry {
  std::string_view value;
  double quality{};
  int32_t order{};

  bool operator==(const TokenEntry &) const noexcept = default;
};

// Parse one (already trimmed) header segment of the form: token OWS [';' params].
// The token holds neither whitespace nor ';'. Only the 'q' parameter is interpreted.
// Returns std::nullopt if the segment does not match the grammar or if its 'q' value is malformed.
[[nodiscard]] std::optional<TokenEntry> ParseTokenEntry(std::string_view segment, int32_t order);

// Exact case-insensitive match scores 1, wildcard entry '*' scores 0, anything else does not match.
[[nodiscard]] std::optional<Specificity> SpecifyToken(std::string_view candidate, const TokenEntry &entry,
                                                      int32_t candidateOrder) noexcept;

}  // namespace conneg
