#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace janitor::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, JanitorConfigFromFile& cfg, std::string& err);

} // namespace janitor::config::detail
