#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace janitor {

// Conventional uploads location below a deployment base directory.
std::filesystem::path UploadsRootFromBase(const std::filesystem::path& base_dir);

// Maps upload URLs ("/uploads/x.jpg", "https://host/uploads/x.jpg") to files
// below a fixed uploads root. Immutable after construction, safe to share
// between threads.
class UploadPathResolver {
  public:
    static constexpr std::string_view kUrlPrefix = "/uploads/";

    explicit UploadPathResolver(std::filesystem::path uploads_root);

    // Returns the local file for `url`, or nullopt when the URL does not
    // reference a local upload or would escape the root.
    std::optional<std::filesystem::path> Resolve(std::string_view url) const;

    const std::filesystem::path& Root() const { return root_; }

  private:
    static std::optional<std::string> RelativePart(std::string_view url);

    std::filesystem::path root_;
};

} // namespace janitor
