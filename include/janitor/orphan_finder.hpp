#pragma once

#include "janitor/upload_path_resolver.hpp"

#include <expected>
#include <string>
#include <vector>

namespace janitor {

// Regular files directly inside the uploads root that none of
// `referenced_urls` resolves to, returned as "/uploads/<name>" URLs sorted by
// name. Subdirectories are not descended into.
std::expected<std::vector<std::string>, std::string> FindOrphanUploads(
    const UploadPathResolver& resolver, const std::vector<std::string>& referenced_urls);

} // namespace janitor
