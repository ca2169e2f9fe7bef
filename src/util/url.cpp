#include "util/url.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace janitor {

namespace {

// Schemes whose last path segment may carry ";params".
constexpr std::array<std::string_view, 15> kParamSchemes = {
    "",     "ftp",  "hdl",  "prospero", "http", "imap", "https", "shttp",
    "rtsp", "rtspu", "sip", "sips",     "mms",  "sftp", "tel",
};

bool IsSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::string Sanitize(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && static_cast<unsigned char>(text[start]) <= 0x20) ++start;

    std::string out;
    out.reserve(text.size() - start);
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\t' || c == '\r' || c == '\n') continue;
        out.push_back(c);
    }
    return out;
}

bool UsesParams(std::string_view scheme) {
    return std::find(kParamSchemes.begin(), kParamSchemes.end(), scheme) != kParamSchemes.end();
}

} // namespace

std::expected<Url, std::string> ParseUrl(std::string_view text) {
    const std::string s = Sanitize(text);
    std::string_view rest(s);
    Url url;

    const auto colon = rest.find(':');
    if (colon != std::string_view::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(rest.front()))) {
        const auto candidate = rest.substr(0, colon);
        if (std::all_of(candidate.begin(), candidate.end(), IsSchemeChar)) {
            url.scheme.reserve(candidate.size());
            for (char c : candidate) {
                url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            rest.remove_prefix(colon + 1);
        }
    }

    if (rest.rfind("//", 0) == 0) {
        rest.remove_prefix(2);
        const auto end = rest.find_first_of("/?#");
        url.netloc = std::string(rest.substr(0, end));
        rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);

        const bool open = url.netloc.find('[') != std::string::npos;
        const bool close = url.netloc.find(']') != std::string::npos;
        if (open != close) {
            return std::unexpected("invalid IPv6 authority: " + url.netloc);
        }
    }

    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        url.query = std::string(rest.substr(q + 1));
        rest = rest.substr(0, q);
    }

    url.path = std::string(rest);
    if (UsesParams(url.scheme)) {
        const auto last_slash = url.path.rfind('/');
        const auto semi = url.path.find(';', last_slash == std::string::npos ? 0 : last_slash);
        if (semi != std::string::npos) {
            url.params = url.path.substr(semi + 1);
            url.path.erase(semi);
        }
    }

    return url;
}

} // namespace janitor
