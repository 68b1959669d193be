#pragma once

#include "userjs/result.hpp"

#include <string>

namespace userjs {

inline constexpr const char kDefaultUpstreamUrl[] =
    "https://raw.githubusercontent.com/ghacksuserjs/ghacks-user.js/master/user.js";

// Supplier of the canonical upstream user.js text.
class IScriptSource {
  public:
    virtual ~IScriptSource() = default;

    // On failure returns ErrorKind::Network and leaves `out` unspecified.
    virtual Result Fetch(std::string& out) = 0;

    virtual std::string Location() const = 0;
};

// Single GET over HTTP(S); redirects are followed, anything but 200 is an error.
class HttpScriptSource final : public IScriptSource {
  public:
    struct Options {
        std::string url = kDefaultUpstreamUrl;
        unsigned connect_timeout_sec = 10;
        unsigned read_timeout_sec = 30;
    };

    explicit HttpScriptSource(Options opt);

    Result Fetch(std::string& out) override;
    std::string Location() const override { return opt_.url; }

  private:
    Options opt_;
};

} // namespace userjs
