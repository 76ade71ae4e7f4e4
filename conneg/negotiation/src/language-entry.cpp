#include "conneg/language-entry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/http-constants.hpp"
#include "conneg/quality-value.hpp"
#include "conneg/specificity.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

namespace {

constexpr std::size_t TagLength(std::string_view sv, bool stopAtDash) noexcept {
  std::size_t len = 0;
  while (len < sv.size() && !IsSpace(sv[len]) && sv[len] != http::ParameterSep && (!stopAtDash || sv[len] != '-')) {
    ++len;
  }
  return len;
}

}  // namespace

std::optional<LanguageEntry> ParseLanguageEntry(std::string_view segment, int32_t order) {
  segment = SkipSpaces(segment);

  const std::size_t primaryLen = TagLength(segment, true);
  if (primaryLen == 0) {
    return std::nullopt;
  }

  LanguageEntry entry{segment.substr(0, primaryLen), {}, segment.substr(0, primaryLen), kDefaultQuality, order};

  std::string_view rest = segment.substr(primaryLen);
  if (!rest.empty() && rest.front() == '-') {
    const std::size_t extensionLen = TagLength(rest.substr(1), false);
    if (extensionLen == 0) {
      return std::nullopt;
    }
    entry.extension = rest.substr(1, extensionLen);
    entry.full = segment.substr(0, primaryLen + 1 + extensionLen);
    rest.remove_prefix(1 + extensionLen);
  }

  rest = SkipSpaces(rest);
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

std::optional<Specificity> SpecifyLanguage(const LanguageEntry &candidate, const LanguageEntry &entry,
                                           int32_t candidateOrder) noexcept {
  uint8_t bits;
  if (CaseInsensitiveEqual(entry.full, candidate.full)) {
    bits = 4;
  } else if (CaseInsensitiveEqual(entry.primary, candidate.full)) {
    bits = 2;
  } else if (CaseInsensitiveEqual(entry.full, candidate.primary)) {
    bits = 1;
  } else if (entry.full == http::Wildcard) {
    bits = 0;
  } else {
    return std::nullopt;
  }
  return Specificity{candidateOrder, entry.order, entry.quality, bits};
}

}  // namespace conneg
