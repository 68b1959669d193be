#include "userjs/script_source.hpp"

#include "userjs/logger.hpp"
#include "userjs/url_utils.hpp"

#include <httplib.h>

#include <exception>
#include <utility>

namespace userjs {

HttpScriptSource::HttpScriptSource(Options opt) : opt_(std::move(opt)) {}

Result HttpScriptSource::Fetch(std::string& out) {
    const auto parts = SplitUrl(opt_.url);
    if (!parts) {
        return Result::Fail(ErrorKind::Network, "invalid upstream URL: " + opt_.url);
    }

    LogInfo("Retrieving latest user.js from %s", opt_.url.c_str());

    try {
        httplib::Client cli(parts->origin);
        cli.set_connection_timeout(static_cast<time_t>(opt_.connect_timeout_sec), 0);
        cli.set_read_timeout(static_cast<time_t>(opt_.read_timeout_sec), 0);
        cli.set_follow_location(true);

        auto res = cli.Get(parts->path);
        if (!res) {
            return Result::Fail(ErrorKind::Network,
                                static_cast<int>(res.error()),
                                "GET " + opt_.url + " failed: " + httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            return Result::Fail(ErrorKind::Network,
                                res->status,
                                "GET " + opt_.url + " returned HTTP " + std::to_string(res->status));
        }

        LogDebug("GET %s -> %d (%zu bytes)", parts->path.c_str(), res->status, res->body.size());
        out = std::move(res->body);
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Network, std::string("HTTP client error: ") + e.what());
    }

    return Result::Ok();
}

} // namespace userjs
