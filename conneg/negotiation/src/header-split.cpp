#include "conneg/header-split.hpp"

#include <cstddef>
#include <string_view>

#include "conneg/http-constants.hpp"
#include "conneg/string-utils.hpp"
#include "conneg/vector.hpp"

namespace conneg {

vector<std::string_view> SplitOn(std::string_view value, char delim) {
  vector<std::string_view> pieces;
  while (true) {
    auto pos = value.find(delim);
    pieces.push_back(value.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(pos + 1);
  }
  return pieces;
}

vector<std::string_view> SplitQuoteAware(std::string_view value, char delim) {
  vector<std::string_view> pieces;
  std::size_t pieceBeg = 0;
  std::size_t nbQuotes = 0;
  for (std::size_t pos = 0; pos < value.size(); ++pos) {
    const char ch = value[pos];
    if (ch == '"') {
      ++nbQuotes;
    } else if (ch == delim && nbQuotes % 2 == 0) {
      pieces.push_back(value.substr(pieceBeg, pos - pieceBeg));
      pieceBeg = pos + 1;
      nbQuotes = 0;
    }
  }
  pieces.push_back(value.substr(pieceBeg));
  return pieces;
}

vector<std::string_view> SplitParameters(std::string_view params) {
  auto pieces = SplitQuoteAware(params, http::ParameterSep);
  for (auto &piece : pieces) {
    piece = TrimOws(piece);
  }
  return pieces;
}

KeyValue SplitKeyValue(std::string_view param) noexcept {
  auto eqPos = param.find('=');
  if (eqPos == std::string_view::npos) {
    return {param, {}};
  }
  return {param.substr(0, eqPos), param.substr(eqPos + 1)};
}

}  // namespace conneg
