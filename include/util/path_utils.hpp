#pragma once

#include <string>
#include <string_view>

namespace janitor {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Drops leading and trailing whitespace (space, \t, \n, \v, \f, \r).
inline std::string_view TrimWhitespace(std::string_view s) {
    constexpr std::string_view kWs = " \t\n\v\f\r";
    const auto first = s.find_first_not_of(kWs);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(kWs);
    return s.substr(first, last - first + 1);
}

inline bool IsBlank(std::string_view s) {
    return TrimWhitespace(s).empty();
}

// Strip leading "/" and "\" so the remainder can never be taken as absolute.
inline std::string_view StripLeadingSeparators(std::string_view s) {
    while (!s.empty() && (s.front() == '/' || s.front() == '\\')) s.remove_prefix(1);
    return s;
}

inline std::string BackslashesToSlashes(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    return s;
}

} // namespace janitor
