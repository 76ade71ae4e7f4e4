#pragma once

#include <optional>
#include <string_view>

namespace conneg {

inline constexpr double kDefaultQuality = 1.0;

// Parse a qvalue (the value of a 'q' parameter), clamped to [0, 1].
// Returns std::nullopt if the whole string is not a valid floating point number (NaN included).
[[nodiscard]] std::optional<double> ParseQuality(std::string_view value) noexcept;

// Scan a ';' separated parameter list (without the leading ';') for the first parameter whose key is exactly 'q'
// and parse its value. Other parameters are ignored.
// Returns kDefaultQuality when no 'q' parameter is present, std::nullopt when the 'q' parameter is malformed.
[[nodiscard]] std::optional<double> ScanQualityParameter(std::string_view params) noexcept;

}  // namespace conneg
