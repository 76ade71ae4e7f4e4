#pragma once

#include <string_view>

#include "conneg/vector.hpp"

namespace conneg {

struct HeaderField {
  std::string_view name;
  std::string_view value;

  bool operator==(const HeaderField &) const noexcept = default;
};

// Read-only access to the header fields of a request.
class HeaderSource {
 public:
  using Values = SmallVector<std::string_view, 2>;

  HeaderSource() noexcept = default;
  HeaderSource(const HeaderSource &) noexcept = default;
  HeaderSource &operator=(const HeaderSource &) noexcept = default;
  virtual ~HeaderSource() = default;

  // Values of all the fields named 'name' (case-insensitive), in arrival order.
  // An empty result means that the header is absent; a header present with an empty value gives one empty value.
  [[nodiscard]] virtual Values headerValues(std::string_view name) const = 0;
};

}  // namespace conneg
