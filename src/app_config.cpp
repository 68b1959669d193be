#include "userjs/app_config.hpp"

#include "userjs/config_json_utils.hpp"
#include "userjs/text_file.hpp"
#include "userjs/url_utils.hpp"

#include <utility>

namespace userjs::config {

Result AppConfig::LoadFile(const std::string& path) {
    std::string text;
    auto rr = ReadTextFile(path, text);
    if (!rr.is_ok())
        return rr;

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(text, path, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }

    AppConfig loaded = *this;
    if (!detail::FillConfigFromJson(json, loaded, err)) {
        return Result::Fail(ErrorKind::Config, err + " in " + path);
    }

    *this = std::move(loaded);
    return Result::Ok();
}

Result AppConfig::Validate() const {
    if (!SplitUrl(upstream_url)) {
        return Result::Fail(ErrorKind::Config, "UpstreamUrl is not an http(s) URL: " + upstream_url);
    }
    if (script_path.empty() || overrides_path.empty() || staging_path.empty()) {
        return Result::Fail(ErrorKind::Config, "ScriptPath/OverridesPath/StagingPath must not be empty");
    }
    if (SameFilePath(staging_path, script_path)) {
        return Result::Fail(ErrorKind::Config, "StagingPath and ScriptPath must differ");
    }
    if (SameFilePath(staging_path, overrides_path)) {
        return Result::Fail(ErrorKind::Config, "StagingPath and OverridesPath must differ");
    }
    if (SameFilePath(overrides_path, script_path)) {
        return Result::Fail(ErrorKind::Config, "OverridesPath and ScriptPath must differ");
    }
    if (family_token.empty()) {
        return Result::Fail(ErrorKind::Config, "FamilyToken must not be empty");
    }
    return Result::Ok();
}

UpdateWorkflow::Options AppConfig::ToWorkflowOptions() const {
    UpdateWorkflow::Options opt;
    opt.script_path = script_path;
    opt.overrides_path = overrides_path;
    opt.staging_path = staging_path;
    opt.family_token = family_token;
    opt.mode = minify ? UpdateWorkflow::BuildMode::Merge : UpdateWorkflow::BuildMode::Append;
    opt.single_backup = single_backup;
    return opt;
}

HttpScriptSource::Options AppConfig::ToSourceOptions() const {
    HttpScriptSource::Options opt;
    opt.url = upstream_url;
    opt.connect_timeout_sec = connect_timeout_sec;
    opt.read_timeout_sec = read_timeout_sec;
    return opt;
}

} // namespace userjs::config
