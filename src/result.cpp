#include "userjs/result.hpp"

namespace userjs {

namespace {

// `msg` carries the offending path for the two "missing input" kinds.
std::string NotDetected(const std::string& path, const char* fallback) {
    if (path.empty()) return std::string(fallback) + " not detected in the current directory.";
    if (path.find('/') == std::string::npos) return path + " not detected in the current directory.";
    return path + " not detected.";
}

} // namespace

std::string Describe(const Result& r) {
    switch (r.kind) {
        case ErrorKind::None:             return r.msg;
        case ErrorKind::MissingScript:    return NotDetected(r.msg, "user.js");
        case ErrorKind::MissingOverrides: return NotDetected(r.msg, "user-overrides.js");
        case ErrorKind::Parse:            return "Error parsing input: " + r.msg;
        case ErrorKind::Io:               return "IO Error: " + r.msg;
        case ErrorKind::Network:          return "Network error: " + r.msg;
        case ErrorKind::Config:           return "Configuration error: " + r.msg;
    }
    return r.msg;
}

} // namespace userjs
