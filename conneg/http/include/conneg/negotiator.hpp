#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "conneg/header-source.hpp"
#include "conneg/negotiator-config.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Content negotiation facade over the Accept, Accept-Charset, Accept-Encoding and Accept-Language headers of a
// request.
//
// For each dimension:
//   * xxxs(available) returns the values of 'available' acceptable by the client, best first. If 'available' is
//     empty, it returns instead the values accepted by the client, by decreasing preference.
//   * xxx(available) returns the first element of xxxs(available), or an empty string if there is none.
// Multiple fields with the same name are joined with ','. An absent header is replaced by its default value from
// NegotiatorConfig ('*', or '*/*' for Accept), which accepts any candidate.
//
// The Negotiator only keeps a reference to the HeaderSource, which must outlive it. It holds no other state, so the
// same object can be reused for different candidate lists.
class Negotiator {
 public:
  using Candidates = std::span<const std::string_view>;

  // Throws std::invalid_argument if 'config' is invalid.
  explicit Negotiator(const HeaderSource &headers, NegotiatorConfig config = {});

  // 'headers' is only referenced, a temporary would dangle.
  Negotiator(const HeaderSource &&headers, NegotiatorConfig config = {}) = delete;

  [[nodiscard]] std::string charset(Candidates available = {}) const;
  [[nodiscard]] std::string charset(std::initializer_list<std::string_view> available) const {
    return charset(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] vector<std::string> charsets(Candidates available = {}) const;
  [[nodiscard]] vector<std::string> charsets(std::initializer_list<std::string_view> available) const {
    return charsets(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] std::string encoding(Candidates available = {}) const;
  [[nodiscard]] std::string encoding(std::initializer_list<std::string_view> available) const {
    return encoding(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] vector<std::string> encodings(Candidates available = {}) const;
  [[nodiscard]] vector<std::string> encodings(std::initializer_list<std::string_view> available) const {
    return encodings(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] std::string language(Candidates available = {}) const;
  [[nodiscard]] std::string language(std::initializer_list<std::string_view> available) const {
    return language(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] vector<std::string> languages(Candidates available = {}) const;
  [[nodiscard]] vector<std::string> languages(std::initializer_list<std::string_view> available) const {
    return languages(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] std::string mediaType(Candidates available = {}) const;
  [[nodiscard]] std::string mediaType(std::initializer_list<std::string_view> available) const {
    return mediaType(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] vector<std::string> mediaTypes(Candidates available = {}) const;
  [[nodiscard]] vector<std::string> mediaTypes(std::initializer_list<std::string_view> available) const {
    return mediaTypes(Candidates(available.begin(), available.size()));
  }

  [[nodiscard]] const NegotiatorConfig &config() const noexcept { return _config; }

 private:
  // Header value to negotiate on: the joined fields of 'name', or 'defaultValue' if absent.
  // 'buf' is used as storage when several fields need to be joined.
  std::string_view acceptValue(std::string_view name, std::string_view defaultValue, std::string &buf) const;

  const HeaderSource &_headers;
  NegotiatorConfig _config;
};

}  // namespace conneg
