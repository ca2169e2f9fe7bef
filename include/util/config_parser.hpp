#pragma once
#include <optional>
#include <string>

namespace janitor::config {

class JanitorConfigFromFile {
public:
    std::optional<std::string> uploads_root;
    std::optional<std::string> base_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    std::optional<bool> sort_results;

    bool LoadFile(const std::string &path);
    bool LoadString(const std::string &json_text);

    // UploadsRoot if set, else <BaseDir>/data/uploads, else empty.
    std::string EffectiveUploadsRoot() const;

    const std::string &LastError() const { return last_error_; }

    void Reset();

private:
    std::string last_error_;
};

} // namespace janitor::config
