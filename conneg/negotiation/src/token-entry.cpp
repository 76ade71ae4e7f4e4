#include "conneg/token-entry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/http-constants.hpp"
#include "conneg/quality-value.hpp"
#include "conneg/specificity.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

std::optional<TokenEntry> ParseTokenEntry(std::string_view segment, int32_t order) {
  segment = SkipSpaces(segment);

  std::size_t tokenLen = 0;
  while (tokenLen < segment.size() && !IsSpace(segment[tokenLen]) && segment[tokenLen] != http::ParameterSep) {
    ++tokenLen;
  }
  if (tokenLen == 0) {
    return std::nullopt;
  }

  TokenEntry entry{segment.substr(0, tokenLen), kDefaultQuality, order};

  std::string_view rest = SkipSpaces(segment.substr(tokenLen));
  if (rest.empty()) {
    return entry;
  }
  if (rest.front() != http::ParameterSep) {
    return std::nullopt;
  }
  auto quality = ScanQualityParameter(rest.substr(1));
  if (!quality) {
    return std::nullopt;
  }
  entry.quality = *quality;
  return entry;
}

std::optional<Specificity> SpecifyToken(std::string_view candidate, const TokenEntry &entry,
                                        int32_t candidateOrder) noexcept {
  uint8_t bits = 0;
  if (CaseInsensitiveEqual(entry.value, candidate)) {
    bits |= 1;
  } else if (entry.value != http::Wildcard) {
    return std::nullopt;
  }
  return Specificity{candidateOrder, entry.order, entry.quality, bits};
}

}  // namespace conneg
