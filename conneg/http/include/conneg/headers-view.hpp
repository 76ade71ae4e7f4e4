#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>

#include "conneg/header-source.hpp"

namespace conneg {

// Non-owning view over a raw header block, as received after the request line:
//   "Accept: text/html\r\nAccept-Language: fr, en;q=0.5\r\n\r\n"
// Each line is split on its first ':', and the value is trimmed of OWS.
// Iteration stops at the first empty line (end of the header section) or at the end of the buffer.
// A line without ':' is reported as a field with an empty value.
class HeadersView : public HeaderSource {
 public:
  HeadersView() noexcept : _beg(nullptr), _end(nullptr) {}

  explicit HeadersView(std::string_view sv) noexcept : _beg(sv.data()), _end(sv.data() + sv.size()) {}

  class iterator {
   public:
    using value_type = HeaderField;
    using reference = HeaderField;
    using pointer = void;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;

    iterator() noexcept : _cur(nullptr), _end(nullptr), _lineLen(0), _nameLen(0) {}

    HeaderField operator*() const noexcept;

    iterator &operator++() noexcept;

    iterator operator++(int) noexcept {
      iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const iterator &rhs) const noexcept { return _cur == rhs._cur; }

   private:
    friend class HeadersView;

    iterator(const char *beg, const char *end) noexcept;

    void setLen() noexcept;

    const char *_cur;
    const char *_end;
    uint32_t _lineLen;
    uint32_t _nameLen;
  };

  [[nodiscard]] iterator begin() const noexcept { return {_beg, _end}; }
  [[nodiscard]] iterator end() const noexcept { return {_end, _end}; }

  [[nodiscard]] Values headerValues(std::string_view name) const override;

 private:
  const char *_beg;
  const char *_end;
};

}  // namespace conneg
