#pragma once

#include <cstdint>

namespace conneg {

// Result of scoring one candidate value against one preference entry.
struct Specificity {
  // Index of the candidate (available value) that produced this score.
  int32_t order{};
  // Order of the preference entry that matched, -1 if none did.
  int32_t entryOrder{-1};
  // Quality of the matched entry.
  double quality{};
  // How exactly the entry matched, dimension specific. Higher is more specific.
  uint8_t specificityBits{};

  // The "no match" result for candidate 'candidateOrder'.
  static constexpr Specificity NoMatch(int32_t candidateOrder) noexcept { return Specificity{candidateOrder}; }

  // A candidate whose priority is excluded never appears in negotiation results.
  [[nodiscard]] constexpr bool excluded() const noexcept { return entryOrder < 0 || quality <= 0.0; }

  bool operator==(const Specificity &) const noexcept = default;
};

// Running best selection among the matching entries of a single candidate: 'spec' replaces 'best' as soon as one of
// its specificity, quality or entry order is strictly greater than the incumbent's.
constexpr bool ShouldReplace(const Specificity &best, const Specificity &spec) noexcept {
  return best.specificityBits < spec.specificityBits || best.quality < spec.quality ||
         best.entryOrder < spec.entryOrder;
}

// Total order of negotiation results: higher quality first, then more specific match, then earlier preference
// entry, then earlier candidate.
struct SpecificityGreater {
  constexpr bool operator()(const Specificity &lhs, const Specificity &rhs) const noexcept {
    if (lhs.quality != rhs.quality) {
      return lhs.quality > rhs.quality;
    }
    if (lhs.specificityBits != rhs.specificityBits) {
      return lhs.specificityBits > rhs.specificityBits;
    }
    if (lhs.entryOrder != rhs.entryOrder) {
      return lhs.entryOrder < rhs.entryOrder;
    }
    return lhs.order < rhs.order;
  }
};

}  // namespace conneg
