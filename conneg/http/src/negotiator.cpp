#include "conneg/negotiator.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "conneg/header-source.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/log.hpp"
#include "conneg/negotiate.hpp"
#include "conneg/negotiator-config.hpp"
#include "conneg/vector.hpp"

namespace conneg {

namespace {

vector<std::string> ToStrings(const vector<std::string_view> &views) {
  vector<std::string> ret;
  ret.reserve(views.size());
  for (std::string_view view : views) {
    ret.emplace_back(view);
  }
  return ret;
}

std::string MostPreferred(const vector<std::string> &values) {
  if (values.empty()) {
    return {};
  }
  return values.front();
}

}  // namespace

Negotiator::Negotiator(const HeaderSource &headers, NegotiatorConfig config)
    : _headers(headers), _config(std::move(config)) {
  _config.validate();
}

std::string_view Negotiator::acceptValue(std::string_view name, std::string_view defaultValue,
                                         std::string &buf) const {
  const auto values = _headers.headerValues(name);
  if (values.empty()) {
    log::debug("{} absent, using '{}'", name, defaultValue);
    return defaultValue;
  }
  if (values.size() == 1) {
    return values.front();
  }
  buf.append(values.front());
  for (auto it = values.begin() + 1; it != values.end(); ++it) {
    buf.push_back(http::HeaderValueSep);
    buf.append(*it);
  }
  return buf;
}

vector<std::string> Negotiator::charsets(Candidates available) const {
  std::string buf;
  return ToStrings(PreferredCharsets(acceptValue(http::AcceptCharset, _config.defaultAcceptCharset, buf), available));
}

std::string Negotiator::charset(Candidates available) const { return MostPreferred(charsets(available)); }

vector<std::string> Negotiator::encodings(Candidates available) const {
  std::string buf;
  return ToStrings(
      PreferredEncodings(acceptValue(http::AcceptEncoding, _config.defaultAcceptEncoding, buf), available));
}

std::string Negotiator::encoding(Candidates available) const { return MostPreferred(encodings(available)); }

vector<std::string> Negotiator::languages(Candidates available) const {
  std::string buf;
  return ToStrings(
      PreferredLanguages(acceptValue(http::AcceptLanguage, _config.defaultAcceptLanguage, buf), available));
}

std::string Negotiator::language(Candidates available) const { return MostPreferred(languages(available)); }

vector<std::string> Negotiator::mediaTypes(Candidates available) const {
  std::string buf;
  return ToStrings(PreferredMediaTypes(acceptValue(http::Accept, _config.defaultAccept, buf), available));
}

std::string Negotiator::mediaType(Candidates available) const { return MostPreferred(mediaTypes(available)); }

}  // namespace conneg
