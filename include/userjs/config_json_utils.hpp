#pragma once

#include "userjs/app_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace userjs::config::detail {

bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, AppConfig& cfg, std::string& err);

} // namespace userjs::config::detail
