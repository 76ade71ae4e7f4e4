#include "conneg/negotiator-config.hpp"

#include <stdexcept>
#include <string_view>

#include "conneg/http-constants.hpp"
#include "conneg/log.hpp"
#include "conneg/negotiate.hpp"

namespace conneg {

void NegotiatorConfig::validate() const {
  auto checkDefault = [](bool hasEntries, std::string_view headerName, std::string_view value) {
    if (!hasEntries) {
      log::critical("default value '{}' for {} holds no valid preference", value, headerName);
      throw std::invalid_argument("default header value holds no valid preference");
    }
  };
  checkDefault(!ParseAccept(defaultAccept).empty(), http::Accept, defaultAccept);
  checkDefault(!ParseAcceptCharset(defaultAcceptCharset).empty(), http::AcceptCharset, defaultAcceptCharset);
  checkDefault(!ParseAcceptLanguage(defaultAcceptLanguage).empty(), http::AcceptLanguage, defaultAcceptLanguage);
  // The implicit identity coding means Accept-Encoding always parses to at least one entry, so check the explicit
  // segments only.
  checkDefault(!ParseAcceptCharset(defaultAcceptEncoding).empty(), http::AcceptEncoding, defaultAcceptEncoding);
}

}  // namespace conneg
