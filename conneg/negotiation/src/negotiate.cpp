#include "conneg/negotiate.hpp"

#include <span>
#include <string_view>

#include "conneg/dimensions.hpp"
#include "conneg/preference-selector.hpp"
#include "conneg/vector.hpp"

namespace conneg {

vector<std::string_view> PreferredCharsets(std::string_view header, std::span<const std::string_view> available) {
  return SelectPreferred<CharsetDimension>(header, available);
}

vector<std::string_view> PreferredEncodings(std::string_view header, std::span<const std::string_view> available) {
  return SelectPreferred<EncodingDimension>(header, available);
}

vector<std::string_view> PreferredLanguages(std::string_view header, std::span<const std::string_view> available) {
  return SelectPreferred<LanguageDimension>(header, available);
}

vector<std::string_view> PreferredMediaTypes(std::string_view header, std::span<const std::string_view> available) {
  return SelectPreferred<MediaTypeDimension>(header, available);
}

vector<TokenEntry> ParseAcceptCharset(std::string_view header) { return ParsePreferences<CharsetDimension>(header); }

vector<TokenEntry> ParseAcceptEncoding(std::string_view header) { return ParsePreferences<EncodingDimension>(header); }

vector<LanguageEntry> ParseAcceptLanguage(std::string_view header) {
  return ParsePreferences<LanguageDimension>(header);
}

vector<MediaTypeEntry> ParseAccept(std::string_view header) { return ParsePreferences<MediaTypeDimension>(header); }

}  // namespace conneg
