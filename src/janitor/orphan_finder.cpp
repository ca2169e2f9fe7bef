#include "janitor/orphan_finder.hpp"

#include "janitor/containment_guard.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_set>

namespace janitor {

namespace fs = std::filesystem;

std::expected<std::vector<std::string>, std::string> FindOrphanUploads(
    const UploadPathResolver& resolver, const std::vector<std::string>& referenced_urls) {
    std::unordered_set<std::string> referenced;
    for (const auto& url : referenced_urls) {
        const auto p = resolver.Resolve(url);
        if (!p) continue;
        if (auto canon = CanonicalPath(*p)) referenced.insert(canon->string());
    }

    std::error_code ec;
    fs::directory_iterator it(resolver.Root(), ec);
    if (ec) {
        return std::unexpected("cannot list " + resolver.Root().string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string name = it->path().filename().string();
        const auto canon = CanonicalPath(resolver.Root() / name);
        if (!canon || referenced.count(canon->string()) == 0) names.push_back(name);
    }
    if (ec) {
        return std::unexpected("error while listing " + resolver.Root().string() + ": " +
                               ec.message());
    }

    std::sort(names.begin(), names.end());
    std::vector<std::string> orphans;
    orphans.reserve(names.size());
    for (const auto& name : names) {
        orphans.push_back(std::string(UploadPathResolver::kUrlPrefix) + name);
    }
    LogDebug("%zu of %zu referenced urls are local, %zu orphan(s)",
             referenced.size(), referenced_urls.size(), orphans.size());
    return orphans;
}

} // namespace janitor
