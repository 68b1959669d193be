#include "userjs/config_json_utils.hpp"

#include <limits>

namespace userjs::config::detail {

namespace {

// Each getter leaves `out` alone when the key is absent and fails only on a
// present key of the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
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

bool GetUnsignedIfPresent(const nlohmann::json& j, const char* key, unsigned& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    const auto v = it->get<long long>();
    if (v < 0 || v > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
        err = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<unsigned>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
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

bool GetLogLevelIfPresent(const nlohmann::json& j, const char* key, LogLevel& out, std::string& err) {
    std::string name;
    if (!GetStringIfPresent(j, key, name, err))
        return false;
    if (name.empty())
        return true;
    auto lvl = ParseLogLevel(name);
    if (!lvl) {
        err = std::string(key) + " has unknown level '" + name + "'";
        return false;
    }
    out = *lvl;
    return true;
}

} // namespace

bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = "invalid JSON in " + origin + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + origin;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, AppConfig& cfg, std::string& err) {
    return GetStringIfPresent(j, "UpstreamUrl", cfg.upstream_url, err) &&
           GetStringIfPresent(j, "ScriptPath", cfg.script_path, err) &&
           GetStringIfPresent(j, "OverridesPath", cfg.overrides_path, err) &&
           GetStringIfPresent(j, "StagingPath", cfg.staging_path, err) &&
           GetStringIfPresent(j, "FamilyToken", cfg.family_token, err) &&
           GetUnsignedIfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err) &&
           GetUnsignedIfPresent(j, "ReadTimeoutSec", cfg.read_timeout_sec, err) &&
           GetLogLevelIfPresent(j, "LogLevel", cfg.log_level, err) &&
           GetBoolIfPresent(j, "Unattended", cfg.unattended, err) &&
           GetBoolIfPresent(j, "Minify", cfg.minify, err) &&
           GetBoolIfPresent(j, "SingleBackup", cfg.single_backup, err);
}

} // namespace userjs::config::detail
