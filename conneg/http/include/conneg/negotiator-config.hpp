#pragma once

#include <string>
#include <string_view>

#include "conneg/http-constants.hpp"

namespace conneg {

// Values assumed by the Negotiator for absent Accept-* headers.
// RFC 7231 section 5.3: a request without such a header field implies that any value is acceptable.
struct NegotiatorConfig {
  // Throws std::invalid_argument if one of the defaults does not hold any valid preference for its header.
  void validate() const;

  NegotiatorConfig &withDefaultAccept(std::string_view value) {
    defaultAccept = value;
    return *this;
  }

  NegotiatorConfig &withDefaultAcceptCharset(std::string_view value) {
    defaultAcceptCharset = value;
    return *this;
  }

  NegotiatorConfig &withDefaultAcceptEncoding(std::string_view value) {
    defaultAcceptEncoding = value;
    return *this;
  }

  NegotiatorConfig &withDefaultAcceptLanguage(std::string_view value) {
    defaultAcceptLanguage = value;
    return *this;
  }

  std::string defaultAccept{http::MediaRangeWildcard};
  std::string defaultAcceptCharset{http::Wildcard};
  std::string defaultAcceptEncoding{http::Wildcard};
  std::string defaultAcceptLanguage{http::Wildcard};
};

}  // namespace conneg
