#include "conneg/dimensions.hpp"

#include <algorithm>
#include <cstdint>

#include "conneg/http-constants.hpp"
#include "conneg/log.hpp"
#include "conneg/quality-value.hpp"
#include "conneg/token-entry.hpp"
#include "conneg/vector.hpp"

namespace conneg {

void EncodingDimension::Complete(vector<Entry> &entries) {
  double minQuality = kDefaultQuality;
  for (const Entry &entry : entries) {
    if (SpecifyToken(http::identity, entry, 0)) {
      return;
    }
    minQuality = std::min(minQuality, entry.quality);
  }
  log::trace("{}: adding implicit '{}' with quality {}", kHeaderName, http::identity, minQuality);
  entries.push_back(Entry{http::identity, minQuality, static_cast<int32_t>(entries.size())});
}

}  // namespace conneg
