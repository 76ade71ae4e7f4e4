#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "conneg/specificity.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Parameters of a media range acting as match constraints ('q' excluded).
// Names are compared case-insensitively; a later parameter overrides an earlier one with the same name.
class MediaTypeParameters {
 public:
  struct Parameter {
    std::string_view name;
    std::string_view value;

    bool operator==(const Parameter &) const noexcept = default;
  };

  // Insert or override parameter 'name'.
  void set(std::string_view name, std::string_view value);

  // Get the value of parameter 'name', or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view name) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] auto size() const noexcept { return _params.size(); }

  [[nodiscard]] auto begin() const noexcept { return _params.begin(); }
  [[nodiscard]] auto end() const noexcept { return _params.end(); }

  // Order insensitive comparison.
  bool operator==(const MediaTypeParameters &rhs) const noexcept;

 private:
  SmallVector<Parameter, 2> _params;
};

// Preference entry of Accept, for instance 'text/html;level=1;q=0.8'.
struct MediaTypeEntry {
  // 'type/subtype', without parameters.
  [[nodiscard]] std::string_view essence() const noexcept {
    return {type.data(), static_cast<std::string_view::size_type>(subtype.data() + subtype.size() - type.data())};
  }

  std::string_view type;
  std::string_view subtype;
  MediaTypeParameters parameters;
  double quality{};
  int32_t order{};

  bool operator==(const MediaTypeEntry &) const noexcept = default;
};

// Parse one header segment of the form: type '/' subtype OWS [';' params].
// The type holds neither whitespace, '/' nor ';', the subtype neither whitespace nor ';'.
// Parameters are split in a quote aware manner, a quoted value has its surrounding quotes removed.
// The first 'q' parameter gives the quality and ends the parameter list (following ones are accept extensions).
// Returns std::nullopt if the segment does not match the grammar or if its 'q' value is malformed.
[[nodiscard]] std::optional<MediaTypeEntry> ParseMediaTypeEntry(std::string_view segment, int32_t order);

// Score a candidate media type (parsed with ParseMediaTypeEntry) against a preference entry.
// Same type adds 4, same subtype adds 2, otherwise the entry needs a '*' in that position.
// If the entry has parameters, all of them have to be '*' or equal to the candidate's ones to add 1, and the
// candidate does not match otherwise.
[[nodiscard]] std::optional<Specificity> SpecifyMediaType(const MediaTypeEntry &candidate, const MediaTypeEntry &entry,
                                                          int32_t candidateOrder) noexcept;

}  // namespace conneg
