#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace janitor {

// Components of a generic URL: scheme://netloc/path;params?query#fragment
// Values are kept verbatim (no percent-decoding).
struct Url {
    std::string scheme; // lowercased, empty for relative references
    std::string netloc;
    std::string path;
    std::string params;
    std::string query;
    std::string fragment;
};

std::expected<Url, std::string> ParseUrl(std::string_view text);

} // namespace janitor
