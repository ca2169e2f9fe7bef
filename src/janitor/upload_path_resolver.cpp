#include "janitor/upload_path_resolver.hpp"

#include "janitor/containment_guard.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/url.hpp"

#include <system_error>
#include <utility>

namespace janitor {

namespace fs = std::filesystem;

fs::path UploadsRootFromBase(const fs::path& base_dir) {
    return base_dir / "data" / "uploads";
}

UploadPathResolver::UploadPathResolver(fs::path uploads_root) : root_(std::move(uploads_root)) {
    std::error_code ec;
    fs::path abs = fs::absolute(root_, ec);
    if (!ec) root_ = std::move(abs);
    root_ = root_.lexically_normal();
}

std::optional<std::string> UploadPathResolver::RelativePart(std::string_view url) {
    const std::string_view u = TrimWhitespace(url);
    if (u.empty()) return std::nullopt;

    if (StartsWith(u, kUrlPrefix)) {
        return std::string(StripLeadingSeparators(u.substr(kUrlPrefix.size())));
    }

    auto parsed = ParseUrl(u);
    if (!parsed) {
        LogDebug("ignoring unparsable url: %s", parsed.error().c_str());
        return std::nullopt;
    }

    const std::string path = BackslashesToSlashes(std::move(parsed->path));
    if (!StartsWith(path, kUrlPrefix)) return std::nullopt;
    return std::string(StripLeadingSeparators(std::string_view(path).substr(kUrlPrefix.size())));
}

std::optional<fs::path> UploadPathResolver::Resolve(std::string_view url) const {
    const auto rel = RelativePart(url);
    if (!rel) return std::nullopt;

    const fs::path candidate = root_ / *rel;
    if (!IsContained(candidate, root_)) return std::nullopt;
    return candidate;
}

} // namespace janitor
