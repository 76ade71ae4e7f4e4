#include "conneg/header-list.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

#include "conneg/header-source.hpp"
#include "conneg/string-utils.hpp"

namespace conneg {

HeaderList::HeaderList(std::initializer_list<HeaderField> fields) {
  _fields.reserve(fields.size());
  for (const HeaderField &field : fields) {
    append(field.name, field.value);
  }
}

HeaderList &HeaderList::append(std::string_view name, std::string_view value) {
  _fields.push_back(Field{std::string(name), std::string(value)});
  return *this;
}

std::size_t HeaderList::erase(std::string_view name) {
  auto newEnd = std::remove_if(_fields.begin(), _fields.end(),
                               [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
  const auto nbErased = static_cast<std::size_t>(_fields.end() - newEnd);
  _fields.erase(newEnd, _fields.end());
  return nbErased;
}

HeaderSource::Values HeaderList::headerValues(std::string_view name) const {
  Values values;
  for (const Field &field : _fields) {
    if (CaseInsensitiveEqual(field.name, name)) {
      values.push_back(field.value);
    }
  }
  return values;
}

}  // namespace conneg
