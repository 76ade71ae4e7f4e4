#include "conneg/headers-view.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "conneg/header-source.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

HeadersView::iterator::iterator(const char *beg, const char *end) noexcept
    : _cur(beg), _end(end), _lineLen(0), _nameLen(0) {
  if (_cur != _end) {
    setLen();
  }
}

void HeadersView::iterator::setLen() noexcept {
  const char *lineEnd = std::search(_cur, _end, http::CRLF.begin(), http::CRLF.end());
  if (lineEnd == _cur) {
    // empty line: end of the header section
    _cur = _end;
    return;
  }
  const char *colonPtr = std::find(_cur, lineEnd, http::HeaderSep.front());

  _lineLen = static_cast<uint32_t>(lineEnd - _cur);
  _nameLen = static_cast<uint32_t>(colonPtr - _cur);
}

HeaderField HeadersView::iterator::operator*() const noexcept {
  std::string_view line(_cur, _lineLen);
  std::string_view name = line.substr(0, _nameLen);
  std::string_view value = _nameLen < _lineLen ? line.substr(_nameLen + http::HeaderSep.size()) : std::string_view{};
  return {TrimOws(name), TrimOws(value)};
}

HeadersView::iterator &HeadersView::iterator::operator++() noexcept {
  const auto remaining = static_cast<std::size_t>(_end - _cur);
  const std::size_t step = std::min(remaining, static_cast<std::size_t>(_lineLen) + http::CRLF.size());
  _cur += step;
  if (_cur != _end) {
    setLen();
  }
  return *this;
}

HeaderSource::Values HeadersView::headerValues(std::string_view name) const {
  Values values;
  for (HeaderField field : *this) {
    if (CaseInsensitiveEqual(field.name, name)) {
      values.push_back(field.value);
    }
  }
  return values;
}

}  // namespace conneg
