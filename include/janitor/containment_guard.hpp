#pragma once

#include <filesystem>
#include <optional>

namespace janitor {

// Absolute path with symlinks of the existing prefix followed and "." / ".."
// folded. nullopt on any filesystem error.
std::optional<std::filesystem::path> CanonicalPath(const std::filesystem::path& path);

// True when `path` is `root` itself or lies below it, both after
// canonicalization and after purely lexical folding of "..". A symlink
// followed by ".." therefore has to stay inside the root either way it is
// read. Any canonicalization error yields false.
bool IsContained(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace janitor
