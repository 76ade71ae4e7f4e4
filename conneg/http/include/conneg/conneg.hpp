// conneg Umbrella Header
//
// Include this single header to pull in the public content negotiation API:
//   - Negotiator facade and its configuration
//   - Header sources (HeaderList, HeadersView)
//   - Per header free functions (PreferredCharsets, PreferredEncodings, PreferredLanguages, PreferredMediaTypes)
//
// Usage Example:
//    #include <conneg/conneg.hpp>
//    using namespace conneg;
//    HeaderList headers{{"Accept-Language", "fr-CH, fr;q=0.9, en;q=0.8"}};
//    Negotiator negotiator(headers);
//    std::string lang = negotiator.language({"en", "fr"});  // "fr"

#pragma once

// Facade
#include "conneg/negotiator-config.hpp"  // IWYU pragma: export
#include "conneg/negotiator.hpp"         // IWYU pragma: export

// Header sources
#include "conneg/header-list.hpp"    // IWYU pragma: export
#include "conneg/header-source.hpp"  // IWYU pragma: export
#include "conneg/headers-view.hpp"   // IWYU pragma: export

// Negotiation primitives
#include "conneg/http-constants.hpp"  // IWYU pragma: export
#include "conneg/negotiate.hpp"       // IWYU pragma: export
