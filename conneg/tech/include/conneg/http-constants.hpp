#pragma once

#include <string_view>

namespace conneg::http {

// Header field names are case-insensitive per RFC 7230; they are stored in their canonical form.
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view AcceptCharset = "Accept-Charset";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view AcceptLanguage = "Accept-Language";

// Content-coding that is always acceptable unless explicitly excluded (RFC 7231 section 5.3.4).
inline constexpr std::string_view identity = "identity";

// RFC 7231 section 5.3: a missing field means that any value is acceptable.
inline constexpr std::string_view Wildcard = "*";
inline constexpr std::string_view MediaRangeWildcard = "*/*";

inline constexpr char HeaderValueSep = ',';
inline constexpr char ParameterSep = ';';

inline constexpr std::string_view HeaderSep = ":";
inline constexpr std::string_view CRLF = "\r\n";

}  // namespace conneg::http
