#include "conneg/preference-selector.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "conneg/dimensions.hpp"
#include "conneg/specificity.hpp"
#include "conneg/vector.hpp"

namespace conneg {

namespace {

template <class Dimension>
Specificity Priority(std::string_view candidate, std::string_view header, int32_t candidateOrder) {
  const auto entries = ParsePreferences<Dimension>(header);
  return ResolvePriority<Dimension>(
      candidate, std::span<const typename Dimension::Entry>(entries.data(), entries.size()), candidateOrder);
}

std::vector<std::string_view> ToStd(const vector<std::string_view> &values) { return {values.begin(), values.end()}; }

}  // namespace

using Values = std::vector<std::string_view>;

TEST(PreferenceSelectorTest, ParsePreferencesKeepsOrderDense) {
  const auto entries = ParsePreferences<CharsetDimension>("utf-8, bad;q=x, , iso-8859-1;q=0.8");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0], (TokenEntry{"utf-8", 1.0, 0}));
  EXPECT_EQ(entries[1], (TokenEntry{"iso-8859-1", 0.8, 1}));
}

TEST(PreferenceSelectorTest, EncodingPreferencesGetImplicitIdentity) {
  auto entries = ParsePreferences<EncodingDimension>("gzip");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[1], (TokenEntry{"identity", 1.0, 1}));

  entries = ParsePreferences<EncodingDimension>("gzip;q=0.5, br;q=0.7");
  ASSERT_EQ(entries.size(), 3U);
  EXPECT_EQ(entries[2], (TokenEntry{"identity", 0.5, 2}));

  entries = ParsePreferences<EncodingDimension>("");
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0], (TokenEntry{"identity", 1.0, 0}));

  entries = ParsePreferences<EncodingDimension>("gzip, identity;q=0.2");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[1], (TokenEntry{"identity", 0.2, 1}));

  entries = ParsePreferences<EncodingDimension>("gzip, *;q=0");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[1], (TokenEntry{"*", 0.0, 1}));
}

TEST(PreferenceSelectorTest, ResolvePriorityWithoutEntries) {
  EXPECT_EQ(Priority<CharsetDimension>("utf-8", "", 0), Specificity::NoMatch(0));
  EXPECT_EQ(Priority<MediaTypeDimension>("text/html", "", 0), Specificity::NoMatch(0));
}

TEST(PreferenceSelectorTest, ResolvePriorityCharsets) {
  static constexpr std::string_view kHeader = "utf-8, iso-8859-1;q=0.8, utf-7;q=0.2";
  EXPECT_EQ(Priority<CharsetDimension>("iso-8859-1", kHeader, 1), (Specificity{1, 1, 0.8, 1}));
  EXPECT_EQ(Priority<CharsetDimension>("utf-7", kHeader, 2), (Specificity{2, 2, 0.2, 1}));
  EXPECT_EQ(Priority<CharsetDimension>("utf-16", kHeader, 3), Specificity::NoMatch(3));
}

TEST(PreferenceSelectorTest, ResolvePriorityEncodings) {
  static constexpr std::string_view kHeader = "gzip, compress;q=0.2, identity;q=0.5";
  EXPECT_EQ(Priority<EncodingDimension>("compress", kHeader, 1), (Specificity{1, 1, 0.2, 1}));
  EXPECT_EQ(Priority<EncodingDimension>("identity", kHeader, 2), (Specificity{2, 2, 0.5, 1}));
}

TEST(PreferenceSelectorTest, ResolvePriorityLanguages) {
  static constexpr std::string_view kPrimary = "zh, en;q=0.8";
  EXPECT_EQ(Priority<LanguageDimension>("en", kPrimary, 1), (Specificity{1, 1, 0.8, 4}));
  EXPECT_EQ(Priority<LanguageDimension>("zh-CN", kPrimary, 2), (Specificity{2, 0, 1.0, 1}));
  EXPECT_EQ(Priority<LanguageDimension>("en-US", kPrimary, 3), (Specificity{3, 1, 0.8, 1}));

  static constexpr std::string_view kRegional = "zh-CN, en-US;q=0.8";
  EXPECT_EQ(Priority<LanguageDimension>("zh", kRegional, 0), (Specificity{0, 0, 1.0, 2}));
  EXPECT_EQ(Priority<LanguageDimension>("en", kRegional, 1), (Specificity{1, 1, 0.8, 2}));
  EXPECT_EQ(Priority<LanguageDimension>("zh-CN", kRegional, 2), (Specificity{2, 0, 1.0, 4}));
  EXPECT_EQ(Priority<LanguageDimension>("en-US", kRegional, 3), (Specificity{3, 1, 0.8, 4}));

  // an unparsable candidate never matches, not even '*'
  EXPECT_EQ(Priority<LanguageDimension>("", "*", 7), Specificity::NoMatch(7));
}

TEST(PreferenceSelectorTest, ResolvePriorityMediaTypes) {
  static constexpr std::string_view kHeader = "text/html, text/*;q=0.8";
  // a later entry replaces an earlier more specific one
  EXPECT_EQ(Priority<MediaTypeDimension>("text/html", kHeader, 1), (Specificity{1, 1, 0.8, 4}));
  EXPECT_EQ(Priority<MediaTypeDimension>("text/*", kHeader, 2), (Specificity{2, 1, 0.8, 6}));
  EXPECT_EQ(Priority<MediaTypeDimension>("text/plain", kHeader, 3), (Specificity{3, 1, 0.8, 4}));
  EXPECT_EQ(Priority<MediaTypeDimension>("image/png", kHeader, 4), Specificity::NoMatch(4));
  EXPECT_EQ(Priority<MediaTypeDimension>("image/*", kHeader, 5), Specificity::NoMatch(5));
  EXPECT_EQ(Priority<MediaTypeDimension>("*/*", kHeader, 6), Specificity::NoMatch(6));
  EXPECT_EQ(Priority<MediaTypeDimension>("", "*/*", 12), Specificity::NoMatch(12));
}

TEST(PreferenceSelectorTest, SelectAcceptedSkipsZeroQuality) {
  const auto entries = ParsePreferences<LanguageDimension>("fr;q=0, en;q=0.5, de");
  EXPECT_EQ(ToStd(SelectAccepted<LanguageDimension>(std::span<const LanguageEntry>(entries.data(), entries.size()))),
            (Values{"de", "en"}));
}

TEST(PreferenceSelectorTest, SelectCandidatesExcludesZeroQualityMatches) {
  const auto entries = ParsePreferences<CharsetDimension>("*, utf-8;q=0");
  const std::string_view candidates[] = {"utf-8", "latin1"};
  EXPECT_EQ(ToStd(SelectCandidates<CharsetDimension>(std::span<const TokenEntry>(entries.data(), entries.size()),
                                                     candidates)),
            (Values{"latin1"}));
}

TEST(PreferenceSelectorTest, SelectPreferredTieBreaks) {
  const std::string_view candidates[] = {"text/*", "image/*", "application/json"};
  EXPECT_EQ(ToStd(SelectPreferred<MediaTypeDimension>("text/*;q=0.1, image/*;q=0.1, application/*;q=0.2",
                                                      candidates)),
            (Values{"application/json", "text/*", "image/*"}));
}

TEST(PreferenceSelectorTest, RaisingQualityNeverLowersRank) {
  const std::string_view candidates[] = {"br", "gzip"};
  std::size_t previousRank = std::size(candidates);
  for (std::string_view quality : {"0.1", "0.2", "0.3", "0.4", "0.5", "0.6", "0.7", "0.8", "0.9", "1"}) {
    std::string header("gzip;q=");
    header.append(quality);
    header.append(", br;q=0.5");
    SCOPED_TRACE(header);

    const auto result = ToStd(SelectPreferred<EncodingDimension>(header, candidates));
    ASSERT_EQ(result.size(), 2U);
    const auto rank = static_cast<std::size_t>(std::ranges::find(result, "gzip") - result.begin());
    EXPECT_LE(rank, previousRank);
    previousRank = rank;
  }
  EXPECT_EQ(previousRank, 0U);
}

TEST(PreferenceSelectorTest, RepeatedCallsGiveSameResult) {
  const std::string_view charsets[] = {"utf-8", "latin1", "utf-16"};
  const std::string_view encodings[] = {"br", "gzip", "identity"};
  const std::string_view languages[] = {"en-GB", "fr", "en"};
  const std::string_view mediaTypes[] = {"text/plain", "application/json", "text/html"};

  static constexpr std::string_view kCharsetHeader = "utf-8;q=0.5, *;q=0.5, latin1";
  static constexpr std::string_view kEncodingHeader = "gzip;q=0.5, br;q=0.5, *;q=0.1";
  static constexpr std::string_view kLanguageHeader = "en;q=0.8, fr;q=0.8, *;q=0.1";
  static constexpr std::string_view kMediaTypeHeader = "text/*;q=0.5, application/json;q=0.5, */*;q=0.1";

  for (std::string_view header : {std::string_view{}, kCharsetHeader}) {
    EXPECT_EQ(ToStd(SelectPreferred<CharsetDimension>(header, charsets)),
              ToStd(SelectPreferred<CharsetDimension>(header, charsets)));
  }
  EXPECT_EQ(ToStd(SelectPreferred<EncodingDimension>(kEncodingHeader, encodings)),
            ToStd(SelectPreferred<EncodingDimension>(kEncodingHeader, encodings)));
  EXPECT_EQ(ToStd(SelectPreferred<LanguageDimension>(kLanguageHeader, languages)),
            ToStd(SelectPreferred<LanguageDimension>(kLanguageHeader, languages)));
  EXPECT_EQ(ToStd(SelectPreferred<MediaTypeDimension>(kMediaTypeHeader, mediaTypes)),
            ToStd(SelectPreferred<MediaTypeDimension>(kMediaTypeHeader, mediaTypes)));
  EXPECT_EQ(ToStd(SelectPreferred<MediaTypeDimension>(kMediaTypeHeader, {})),
            ToStd(SelectPreferred<MediaTypeDimension>(kMediaTypeHeader, {})));
}

}  // namespace conneg
