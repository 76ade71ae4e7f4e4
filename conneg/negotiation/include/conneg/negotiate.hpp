#pragma once

#include <span>
#include <string_view>

#include "conneg/dimensions.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Content negotiation entry points, one per Accept-* header (RFC 7231 section 5.3).
//
// 'header' is the raw field value (use the dimension default such as '*' or '*/*' if the header is absent).
// If 'available' is empty, the result is the list of values accepted by the client (quality > 0), by decreasing
// quality then header order. Otherwise, it is the subset of 'available' acceptable by the client, best first.
//
// Malformed header segments never fail the call, they are just ignored.
// Returned views point into 'header' or into the elements of 'available' (or to static storage for the implicit
// 'identity' encoding), so they must not outlive them.

[[nodiscard]] vector<std::string_view> PreferredCharsets(std::string_view header,
                                                         std::span<const std::string_view> available = {});

[[nodiscard]] vector<std::string_view> PreferredEncodings(std::string_view header,
                                                          std::span<const std::string_view> available = {});

[[nodiscard]] vector<std::string_view> PreferredLanguages(std::string_view header,
                                                          std::span<const std::string_view> available = {});

[[nodiscard]] vector<std::string_view> PreferredMediaTypes(std::string_view header,
                                                           std::span<const std::string_view> available = {});

// Parsed preference entries of each header, in header order.
[[nodiscard]] vector<TokenEntry> ParseAcceptCharset(std::string_view header);
[[nodiscard]] vector<TokenEntry> ParseAcceptEncoding(std::string_view header);
[[nodiscard]] vector<LanguageEntry> ParseAcceptLanguage(std::string_view header);
[[nodiscard]] vector<MediaTypeEntry> ParseAccept(std::string_view header);

}  // namespace conneg
