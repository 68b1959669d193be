#pragma once
#include <string>
#include <utility>

namespace userjs {

enum class ErrorKind : int {
    None = 0,
    MissingScript,
    MissingOverrides,
    Parse,
    Io,
    Network,
    Config,
};

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m) { return Fail(k, -1, std::move(m)); }
};

// User-facing rendering of a failed Result.
std::string Describe(const Result& r);

} // namespace userjs
