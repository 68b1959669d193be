#pragma once

#include "userjs/result.hpp"

#include <cerrno>
#include <string>
#include <string_view>

namespace userjs {

// Reads the whole file. A missing file fails with kind Io and err == ENOENT.
Result ReadTextFile(const std::string& path, std::string& out);

// Creates or truncates `path`, writes all of `content` and fsyncs before closing.
Result WriteTextFileDurable(const std::string& path, std::string_view content);

bool FileExists(const std::string& path);

// True when both paths name the same file once "." and ".." components and
// symlinked directories are resolved. Neither file has to exist.
bool SameFilePath(const std::string& a, const std::string& b);

// err only carries an errno for Io results; other kinds store status codes.
inline bool IsNotFound(const Result& r) {
    return !r.ok && r.kind == ErrorKind::Io && r.err == ENOENT;
}

} // namespace userjs
