#pragma once

#include "userjs/logger.hpp"
#include "userjs/result.hpp"
#include "userjs/script_source.hpp"
#include "userjs/update_workflow.hpp"

#include <string>

namespace userjs::config {

inline constexpr const char kDefaultConfigPath[] = "userjs-updater.json";

// Runtime settings: built-in defaults, overlaid by the optional JSON file,
// overlaid by command-line flags (in main).
struct AppConfig {
    std::string upstream_url = kDefaultUpstreamUrl;
    std::string script_path = "user.js";
    std::string overrides_path = "user-overrides.js";
    std::string staging_path = "user.js.new";
    std::string family_token = kDefaultFamilyToken;

    unsigned connect_timeout_sec = 10;
    unsigned read_timeout_sec = 30;
    LogLevel log_level = LogLevel::Info;

    bool unattended = false;
    bool minify = false;
    bool single_backup = false;

    // Keys absent from the file keep their current value. A missing file
    // fails with ErrorKind::Io / ENOENT, anything else malformed with ErrorKind::Config.
    Result LoadFile(const std::string& path);

    Result Validate() const;

    UpdateWorkflow::Options ToWorkflowOptions() const;
    HttpScriptSource::Options ToSourceOptions() const;
};

} // namespace userjs::config
