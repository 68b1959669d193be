// text_file.cpp - Whole-file read and durable write on raw descriptors.

#include "userjs/text_file.hpp"

#include "userjs/fd.hpp"

#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace userjs {

namespace {

std::string ErrnoText(int e) { return std::string(std::strerror(e)); }

} // namespace

Result ReadTextFile(const std::string& path, std::string& out) {
    out.clear();

    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "cannot open " + path + " (" + ErrnoText(e) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    char buf[64 * 1024];
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "read failed: " + path + " (" + ErrnoText(e) + ")");
    }

    return Result::Ok();
}

Result WriteTextFileDurable(const std::string& path, std::string_view content) {
    Fd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "cannot create " + path + " (" + ErrnoText(e) + ")");
    }

    const char* p = content.data();
    size_t rem = content.size();
    while (rem > 0) {
        const ssize_t n = ::write(fd.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "write failed: " + path + " (" + ErrnoText(e) + ")");
    }

    if (::fsync(fd.Get()) == -1) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "fsync failed: " + path + " (" + ErrnoText(e) + ")");
    }
    if (!fd.Close()) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "close failed: " + path + " (" + ErrnoText(e) + ")");
    }

    return Result::Ok();
}

bool FileExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

bool SameFilePath(const std::string& a, const std::string& b) {
    const auto normalize = [](const std::string& p) {
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(p, ec);
        if (ec) {
            return std::filesystem::path(p).lexically_normal();
        }
        return canonical;
    };
    return normalize(a) == normalize(b);
}

} // namespace userjs
