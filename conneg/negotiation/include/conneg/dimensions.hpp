#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/header-split.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/language-entry.hpp"
#include "conneg/media-type-entry.hpp"
#include "conneg/specificity.hpp"
#include "conneg/token-entry.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Negotiation dimension policies plugged into the generic pipeline of preference-selector.hpp.

struct CharsetDimension {
  using Entry = TokenEntry;
  using Subject = std::string_view;

  static constexpr std::string_view kHeaderName = http::AcceptCharset;

  static vector<std::string_view> Split(std::string_view header) { return SplitOn(header, http::HeaderValueSep); }

  static std::optional<Entry> Parse(std::string_view segment, int32_t order) { return ParseTokenEntry(segment, order); }

  static std::optional<Subject> Prepare(std::string_view candidate) noexcept { return candidate; }

  static std::optional<Specificity> Specify(Subject candidate, const Entry &entry, int32_t candidateOrder) noexcept {
    return SpecifyToken(candidate, entry, candidateOrder);
  }

  static std::string_view DisplayValue(const Entry &entry) noexcept { return entry.value; }
};

struct EncodingDimension : CharsetDimension {
  static constexpr std::string_view kHeaderName = http::AcceptEncoding;

  // 'identity' is acceptable unless explicitly excluded: if no entry matches it (by name or by '*'), an 'identity'
  // entry is appended with the lowest quality seen in the header (1 if the header has no entries).
  static void Complete(vector<Entry> &entries);
};

struct LanguageDimension {
  using Entry = LanguageEntry;
  using Subject = LanguageEntry;

  static constexpr std::string_view kHeaderName = http::AcceptLanguage;

  static vector<std::string_view> Split(std::string_view header) { return SplitOn(header, http::HeaderValueSep); }

  static std::optional<Entry> Parse(std::string_view segment, int32_t order) {
    return ParseLanguageEntry(segment, order);
  }

  static std::optional<Subject> Prepare(std::string_view candidate) { return ParseLanguageEntry(candidate, 0); }

  static std::optional<Specificity> Specify(const Subject &candidate, const Entry &entry,
                                            int32_t candidateOrder) noexcept {
    return SpecifyLanguage(candidate, entry, candidateOrder);
  }

  static std::string_view DisplayValue(const Entry &entry) noexcept { return entry.full; }
};

struct MediaTypeDimension {
  using Entry = MediaTypeEntry;
  using Subject = MediaTypeEntry;

  static constexpr std::string_view kHeaderName = http::Accept;

  // Media type parameters may hold quoted-strings, which may themselves hold commas.
  static vector<std::string_view> Split(std::string_view header) {
    return SplitQuoteAware(header, http::HeaderValueSep);
  }

  static std::optional<Entry> Parse(std::string_view segment, int32_t order) {
    return ParseMediaTypeEntry(segment, order);
  }

  static std::optional<Subject> Prepare(std::string_view candidate) { return ParseMediaTypeEntry(candidate, 0); }

  static std::optional<Specificity> Specify(const Subject &candidate, const Entry &entry,
                                            int32_t candidateOrder) noexcept {
    return SpecifyMediaType(candidate, entry, candidateOrder);
  }

  static std::string_view DisplayValue(const Entry &entry) noexcept { return entry.essence(); }
};

}  // namespace conneg
