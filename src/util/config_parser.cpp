#include "util/config_parser.hpp"

#include "janitor/upload_path_resolver.hpp"
#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

namespace janitor::config {

void JanitorConfigFromFile::Reset() {
    uploads_root.reset();
    base_dir.reset();
    log_level.reset();
    log_file.reset();
    sort_results.reset();
    last_error_.clear();
}

bool JanitorConfigFromFile::LoadFile(const std::string &path) {
    Reset();

    nlohmann::json json;
    if (!detail::LoadJsonObjectFromFile(path, json, last_error_)) {
        LogDebug("Config: %s", last_error_.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, last_error_)) {
        last_error_ += " in " + path;
        LogDebug("Config: %s", last_error_.c_str());
        return false;
    }

    return true;
}

bool JanitorConfigFromFile::LoadString(const std::string &json_text) {
    Reset();

    nlohmann::json json;
    if (!detail::ParseJsonObject(json_text, json, last_error_)) {
        return false;
    }
    return detail::FillConfigFromJson(json, *this, last_error_);
}

std::string JanitorConfigFromFile::EffectiveUploadsRoot() const {
    if (uploads_root) return *uploads_root;
    if (base_dir && !base_dir->empty()) return UploadsRootFromBase(*base_dir).string();
    return {};
}

} // namespace janitor::config
