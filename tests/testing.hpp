#pragma once

#include "userjs/result.hpp"
#include "userjs/script_source.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/userjs_updater_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string File(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> ListDirectory(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

// Four-line user.js banner followed by `body`.
inline std::string MakeScript(const std::string& name,
                              const std::string& date,
                              const std::string& version,
                              const std::string& body = "") {
    return "/******\n"
           "* name: " + name + "\n"
           "* date: " + date + "\n"
           "* version " + version + "\n"
           "******/\n" + body;
}

class FakeScriptSource final : public userjs::IScriptSource {
  public:
    explicit FakeScriptSource(std::string text) : text_(std::move(text)) {}

    static FakeScriptSource Failing(std::string msg) {
        FakeScriptSource src("");
        src.fail_ = true;
        src.fail_msg_ = std::move(msg);
        return src;
    }

    userjs::Result Fetch(std::string& out) override {
        ++calls_;
        if (fail_) return userjs::Result::Fail(userjs::ErrorKind::Network, fail_msg_);
        out = text_;
        return userjs::Result::Ok();
    }

    std::string Location() const override { return "fake://upstream/user.js"; }

    int Calls() const { return calls_; }

  private:
    std::string text_;
    bool fail_ = false;
    std::string fail_msg_;
    int calls_ = 0;
};

} // namespace testutil
