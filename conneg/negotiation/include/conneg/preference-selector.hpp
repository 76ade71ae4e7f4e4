#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "conneg/log.hpp"
#include "conneg/specificity.hpp"
#include "conneg/string-utils.hpp"
#include "conneg/vector.hpp"

namespace conneg {

// Generic negotiation pipeline. A Dimension policy (see dimensions.hpp) provides:
//  - Entry                   : parsed preference entry type, with 'quality' and 'order' members
//  - Subject                 : candidate representation used for scoring
//  - kHeaderName             : header field name, for logging only
//  - Split(header)           : segmentation of the raw header value
//  - Parse(segment, order)   : optional<Entry>
//  - Prepare(candidate)      : optional<Subject>, std::nullopt if the candidate can never match
//  - Specify(subject, entry, candidateOrder) : optional<Specificity>
//  - DisplayValue(entry)     : value returned when no candidate list is given
//  - Complete(entries)       : optional post processing hook of the parsed entries
template <class Dimension>
using EntriesOf = vector<typename Dimension::Entry>;

// Parse a header value into its ordered preference entries. Malformed segments are dropped and do not consume an
// order slot.
template <class Dimension>
[[nodiscard]] EntriesOf<Dimension> ParsePreferences(std::string_view header) {
  EntriesOf<Dimension> entries;
  for (std::string_view segment : Dimension::Split(header)) {
    auto entry = Dimension::Parse(TrimOws(segment), static_cast<int32_t>(entries.size()));
    if (entry) {
      entries.push_back(std::move(*entry));
    } else {
      log::trace("{}: dropping malformed segment '{}'", Dimension::kHeaderName, segment);
    }
  }
  if constexpr (requires { Dimension::Complete(entries); }) {
    Dimension::Complete(entries);
  }
  return entries;
}

// Priority of one candidate among all parsed entries. The result is Specificity::NoMatch(candidateOrder) when no
// entry matches, or when the candidate itself cannot be parsed by the dimension.
template <class Dimension>
[[nodiscard]] Specificity ResolvePriority(std::string_view candidate,
                                          std::span<const typename Dimension::Entry> entries, int32_t candidateOrder) {
  Specificity priority = Specificity::NoMatch(candidateOrder);
  auto subject = Dimension::Prepare(candidate);
  if (!subject) {
    return priority;
  }
  for (const auto &entry : entries) {
    auto specificity = Dimension::Specify(*subject, entry, candidateOrder);
    if (specificity && ShouldReplace(priority, *specificity)) {
      priority = *specificity;
    }
  }
  return priority;
}

// Without candidates: the display values of all entries with a positive quality, by decreasing quality then header
// order.
template <class Dimension>
[[nodiscard]] vector<std::string_view> SelectAccepted(std::span<const typename Dimension::Entry> entries) {
  using Entry = typename Dimension::Entry;

  vector<const Entry *> accepted;
  for (const Entry &entry : entries) {
    if (entry.quality > 0.0) {
      accepted.push_back(&entry);
    }
  }
  std::ranges::stable_sort(accepted, [](const Entry *lhs, const Entry *rhs) {
    if (lhs->quality != rhs->quality) {
      return lhs->quality > rhs->quality;
    }
    return lhs->order < rhs->order;
  });

  vector<std::string_view> result;
  result.reserve(accepted.size());
  for (const Entry *entry : accepted) {
    result.push_back(Dimension::DisplayValue(*entry));
  }
  return result;
}

// With candidates: the acceptable candidates, best first (see SpecificityGreater). Candidates that match no entry, or
// only entries with a zero quality, are left out.
template <class Dimension>
[[nodiscard]] vector<std::string_view> SelectCandidates(std::span<const typename Dimension::Entry> entries,
                                                        std::span<const std::string_view> candidates) {
  vector<Specificity> priorities;
  priorities.reserve(candidates.size());
  for (int32_t candidateOrder = 0; std::cmp_less(candidateOrder, candidates.size()); ++candidateOrder) {
    auto priority = ResolvePriority<Dimension>(candidates[candidateOrder], entries, candidateOrder);
    if (priority.excluded()) {
      log::trace("{}: '{}' is not acceptable", Dimension::kHeaderName, candidates[candidateOrder]);
    } else {
      priorities.push_back(priority);
    }
  }
  std::ranges::stable_sort(priorities, SpecificityGreater{});

  vector<std::string_view> result;
  result.reserve(priorities.size());
  for (const Specificity &priority : priorities) {
    result.push_back(candidates[priority.order]);
  }
  return result;
}

// Full pipeline: parse 'header' and select among 'candidates', or among the header own values if 'candidates' is
// empty. Returned views point into 'header', into 'candidates' or to static storage.
template <class Dimension>
[[nodiscard]] vector<std::string_view> SelectPreferred(std::string_view header,
                                                       std::span<const std::string_view> candidates) {
  const auto entries = ParsePreferences<Dimension>(header);
  const std::span<const typename Dimension::Entry> entriesSpan(entries.data(), entries.size());
  if (candidates.empty()) {
    return SelectAccepted<Dimension>(entriesSpan);
  }
  return SelectCandidates<Dimension>(entriesSpan, candidates);
}

}  // namespace conneg
