#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

#include "conneg/header-source.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Owning, ordered list of header fields. Names keep their original case, lookups are case-insensitive.
class HeaderList : public HeaderSource {
 public:
  HeaderList() noexcept = default;

  HeaderList(std::initializer_list<HeaderField> fields);

  // Appends a new field, even if a field with the same name already exists.
  HeaderList &append(std::string_view name, std::string_view value);

  // Removes all fields named 'name' (case-insensitive). Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  [[nodiscard]] Values headerValues(std::string_view name) const override;

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

 private:
  struct Field {
    std::string name;
    std::string value;
  };

  vector<Field> _fields;
};

}  // namespace conneg
