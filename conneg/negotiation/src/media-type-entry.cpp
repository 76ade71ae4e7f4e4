#include "conneg/media-type-entry.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/header-split.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/quality-value.hpp"
#include "conneg/specificity.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

namespace {

// Remove the surrounding quotes of a quoted-string value. A single '"' becomes empty.
constexpr std::string_view Unquote(std::string_view value) noexcept {
  if (!value.empty() && value.front() == '"' && value.back() == '"') {
    return value.size() < 2 ? std::string_view{} : value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

void MediaTypeParameters::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(
      _params, [name](const Parameter &param) { return CaseInsensitiveEqual(param.name, name); });
  if (it != _params.end()) {
    it->value = value;
  } else {
    _params.push_back(Parameter{name, value});
  }
}

std::optional<std::string_view> MediaTypeParameters::find(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(
      _params, [name](const Parameter &param) { return CaseInsensitiveEqual(param.name, name); });
  if (it == _params.end()) {
    return std::nullopt;
  }
  return it->value;
}

bool MediaTypeParameters::operator==(const MediaTypeParameters &rhs) const noexcept {
  if (_params.size() != rhs._params.size()) {
    return false;
  }
  return std::ranges::all_of(_params, [&rhs](const Parameter &param) { return rhs.find(param.name) == param.value; });
}

std::optional<MediaTypeEntry> ParseMediaTypeEntry(std::string_view segment, int32_t order) {
  segment = SkipSpaces(segment);

  std::size_t typeLen = 0;
  while (typeLen < segment.size() && !IsSpace(segment[typeLen]) && segment[typeLen] != '/' &&
         segment[typeLen] != http::ParameterSep) {
    ++typeLen;
  }
  if (typeLen == 0 || typeLen == segment.size() || segment[typeLen] != '/') {
    return std::nullopt;
  }

  const std::size_t subtypeBeg = typeLen + 1;
  std::size_t subtypeEnd = subtypeBeg;
  while (subtypeEnd < segment.size() && !IsSpace(segment[subtypeEnd]) && segment[subtypeEnd] != http::ParameterSep) {
    ++subtypeEnd;
  }
  if (subtypeEnd == subtypeBeg) {
    return std::nullopt;
  }

  MediaTypeEntry entry{segment.substr(0, typeLen), segment.substr(subtypeBeg, subtypeEnd - subtypeBeg), {},
                       kDefaultQuality, order};

  std::string_view rest = SkipSpaces(segment.substr(subtypeEnd));
  if (rest.empty()) {
    return entry;
  }
  if (rest.front() != http::ParameterSep) {
    return std::nullopt;
  }
  rest.remove_prefix(1);
  if (rest.empty()) {
    return entry;
  }

  for (std::string_view param : SplitParameters(rest)) {
    auto [key, value] = SplitKeyValue(param);
    value = Unquote(value);
    if (CaseInsensitiveEqual(key, "q")) {
      auto quality = ParseQuality(value);
      if (!quality) {
        return std::nullopt;
      }
      entry.quality = *quality;
      break;
    }
    entry.parameters.set(key, value);
  }
  return entry;
}

std::optional<Specificity> SpecifyMediaType(const MediaTypeEntry &candidate, const MediaTypeEntry &entry,
                                            int32_t candidateOrder) noexcept {
  uint8_t bits = 0;
  if (CaseInsensitiveEqual(entry.type, candidate.type)) {
    bits |= 4;
  } else if (entry.type != http::Wildcard) {
    return std::nullopt;
  }

  if (CaseInsensitiveEqual(entry.subtype, candidate.subtype)) {
    bits |= 2;
  } else if (entry.subtype != http::Wildcard) {
    return std::nullopt;
  }

  if (!entry.parameters.empty()) {
    const bool allMatch = std::ranges::all_of(entry.parameters, [&candidate](const auto &param) {
      return param.value == http::Wildcard ||
             CaseInsensitiveEqual(param.value, candidate.parameters.find(param.name).value_or(std::string_view{}));
    });
    if (!allMatch) {
      return std::nullopt;
    }
    bits |= 1;
  }
  return Specificity{candidateOrder, entry.order, entry.quality, bits};
}

}  // namespace conneg
