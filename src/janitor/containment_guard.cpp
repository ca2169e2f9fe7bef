#include "janitor/containment_guard.hpp"

#include "util/logger.hpp"

#include <system_error>

namespace janitor {

namespace fs = std::filesystem;

namespace {

bool IsSelfOrDescendant(const fs::path& path, const fs::path& root) {
    auto it = path.begin();
    for (const auto& part : root) {
        if (part.empty()) continue; // trailing separator
        if (it == path.end() || *it != part) return false;
        ++it;
    }
    return true;
}

} // namespace

std::optional<fs::path> CanonicalPath(const fs::path& path) {
    std::error_code ec;
    const fs::path abs = fs::absolute(path, ec);
    if (ec) {
        LogDebug("absolute(%s) failed: %s", path.c_str(), ec.message().c_str());
        return std::nullopt;
    }
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) {
        LogDebug("weakly_canonical(%s) failed: %s", abs.c_str(), ec.message().c_str());
        return std::nullopt;
    }
    return canon;
}

bool IsContained(const fs::path& path, const fs::path& root) {
    const auto canon_root = CanonicalPath(root);
    const auto canon_path = CanonicalPath(path);
    if (!canon_root || !canon_path) {
        return false;
    }

    if (!IsSelfOrDescendant(*canon_path, *canon_root)) {
        LogDebug("path escapes uploads root: %s -> %s (root %s)",
                 path.c_str(), canon_path->c_str(), canon_root->c_str());
        return false;
    }

    std::error_code ec;
    const fs::path lexical_root = fs::absolute(root, ec).lexically_normal();
    const fs::path lexical_path = ec ? fs::path() : fs::absolute(path, ec).lexically_normal();
    if (ec || !IsSelfOrDescendant(lexical_path, lexical_root)) {
        LogDebug("path leaves uploads root lexically: %s -> %s (root %s)",
                 path.c_str(), lexical_path.c_str(), lexical_root.c_str());
        return false;
    }
    return true;
}

} // namespace janitor
