#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace janitor::config::detail {

namespace {

// Present but mistyped keys are an error; absent keys are not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool CheckObject(const nlohmann::json& j, const std::string& what, std::string& err) {
    if (!j.is_object()) {
        err = "root must be JSON object: " + what;
        return false;
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    return CheckObject(out, path, err);
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    return CheckObject(out, "<string>", err);
}

bool FillConfigFromJson(const nlohmann::json& j, JanitorConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "UploadsRoot", cfg.uploads_root, err) ||
        !GetStringIfPresent(j, "BaseDir", cfg.base_dir, err) ||
        !GetStringIfPresent(j, "LogLevel", cfg.log_level, err) ||
        !GetStringIfPresent(j, "LogFile", cfg.log_file, err) ||
        !GetBoolIfPresent(j, "SortResults", cfg.sort_results, err)) {
        return false;
    }

    if (cfg.uploads_root && cfg.uploads_root->empty()) {
        err = "UploadsRoot must not be empty";
        return false;
    }
    if (cfg.log_level && !ParseLogLevel(*cfg.log_level)) {
        err = "unknown LogLevel '" + *cfg.log_level + "'";
        return false;
    }

    return true;
}

} // namespace janitor::config::detail
