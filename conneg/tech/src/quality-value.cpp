#include "conneg/quality-value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <system_error>

#include "conneg/http-constants.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

std::optional<double> ParseQuality(std::string_view value) noexcept {
  if (!value.empty() && value.front() == '+') {
    value.remove_prefix(1);
    if (!value.empty() && value.front() == '-') {
      return std::nullopt;
    }
  }
  if (value.empty()) {
    return std::nullopt;
  }
  double qualityValue = 0.0;
  const char *begin = value.data();
  const char *end = begin + value.size();
  auto fcRes = std::from_chars(begin, end, qualityValue);
  if (fcRes.ec != std::errc() || fcRes.ptr != end || std::isnan(qualityValue)) {
    return std::nullopt;
  }
  return std::clamp(qualityValue, 0.0, 1.0);
}

std::optional<double> ScanQualityParameter(std::string_view params) noexcept {
  while (true) {
    auto nextSemi = params.find(http::ParameterSep);
    std::string_view param = TrimOws(params.substr(0, nextSemi));
    auto eqPos = param.find('=');
    if (param.substr(0, eqPos) == "q") {
      if (eqPos == std::string_view::npos) {
        return std::nullopt;  // 'q' without value
      }
      std::string_view val = param.substr(eqPos + 1);
      return ParseQuality(val.substr(0, val.find('=')));
    }
    if (nextSemi == std::string_view::npos) {
      break;
    }
    params.remove_prefix(nextSemi + 1);
  }
  return kDefaultQuality;
}

}  // namespace conneg
