#include <conneg/conneg.hpp>
#include <conneg/string-utils.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace conneg;

// Usage: negotiate <header-name> <header-value> [available...]
// Example: negotiate Accept-Language "fr-CH, fr;q=0.9, en;q=0.8" en fr de
int main(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <header-name> <header-value> [available...]\n";
    return EXIT_FAILURE;
  }

  const std::string_view headerName(argv[1]);
  HeaderList headers{{headerName, argv[2]}};

  std::vector<std::string_view> available;
  for (int argPos = 3; argPos < argc; ++argPos) {
    available.emplace_back(argv[argPos]);
  }

  try {
    Negotiator negotiator(headers);

    vector<std::string> preferred;
    if (CaseInsensitiveEqual(headerName, http::Accept)) {
      preferred = negotiator.mediaTypes(available);
    } else if (CaseInsensitiveEqual(headerName, http::AcceptCharset)) {
      preferred = negotiator.charsets(available);
    } else if (CaseInsensitiveEqual(headerName, http::AcceptEncoding)) {
      preferred = negotiator.encodings(available);
    } else if (CaseInsensitiveEqual(headerName, http::AcceptLanguage)) {
      preferred = negotiator.languages(available);
    } else {
      std::cerr << "Unsupported header: " << headerName << "\n";
      return EXIT_FAILURE;
    }

    for (const std::string &value : preferred) {
      std::cout << value << '\n';
    }
  } catch (const std::exception &e) {
    std::cerr << "Negotiation error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
