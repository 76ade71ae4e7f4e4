#pragma once

#include <string_view>

#include "conneg/vector.hpp"

namespace conneg {

// Split 'value' on every occurrence of 'delim'. An empty input gives a single empty piece.
[[nodiscard]] vector<std::string_view> SplitOn(std::string_view value, char delim);

// Split 'value' on 'delim', except inside a quoted-string: a piece holding an odd number of '"' so far is extended
// up to the next delimiter instead of being committed. An unterminated quoted-string extends to the end of the input,
// delimiters and quotes included. Pieces are returned untrimmed and point into 'value'.
[[nodiscard]] vector<std::string_view> SplitQuoteAware(std::string_view value, char delim);

// Split a media type parameter list (the part following the first ';') on ';', quote aware.
// Each parameter is trimmed of surrounding OWS.
[[nodiscard]] vector<std::string_view> SplitParameters(std::string_view params);

struct KeyValue {
  std::string_view key;
  std::string_view value;

  bool operator==(const KeyValue &) const noexcept = default;
};

// Split 'key=value' on the first '='. Without '=', the whole parameter is the key and the value is empty.
[[nodiscard]] KeyValue SplitKeyValue(std::string_view param) noexcept;

}  // namespace conneg
