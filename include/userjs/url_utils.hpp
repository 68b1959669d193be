#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace userjs {

struct UrlParts {
    std::string origin; // "https://host[:port]"
    std::string path;   // "/..." (query kept verbatim)
};

// Split an absolute http(s) URL into origin and request path:
// - scheme must be "http" or "https"
// - host must be non-empty
// - missing path becomes "/"
inline std::optional<UrlParts> SplitUrl(std::string_view url) {
    const size_t sep = url.find("://");
    if (sep == std::string_view::npos) return std::nullopt;

    const std::string_view scheme = url.substr(0, sep);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    const std::string_view rest = url.substr(sep + 3);
    const size_t slash = rest.find('/');
    const std::string_view authority = rest.substr(0, slash);
    if (authority.empty() || authority.front() == ':') return std::nullopt;

    UrlParts out;
    out.origin = std::string(scheme) + "://" + std::string(authority);
    out.path = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
    return out;
}

} // namespace userjs
