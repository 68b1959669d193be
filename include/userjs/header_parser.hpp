#pragma once

#include "userjs/result.hpp"

#include <expected>
#include <istream>
#include <string>
#include <string_view>

namespace userjs {

inline constexpr const char kDefaultFamilyToken[] = "ghacks";

struct VersionRecord {
    std::string name;
    std::string version;
    std::string date;

    bool operator==(const VersionRecord&) const = default;

    // "<name>: <version> from <date>"
    std::string ToString() const;
};

// Reads the four-line comment banner at the top of a user.js:
//
//   /******
//   * name: ghacks user.js
//   * date: 14 February 2020
//   * version 73-beta: Soundboard Shuffle
//
// Only the family token in `name` is validated; version and date are opaque.
class HeaderParser {
  public:
    explicit HeaderParser(std::string family_token = kDefaultFamilyToken);

    // Consumes at most four lines from `in`.
    std::expected<VersionRecord, std::string> Parse(std::istream& in) const;
    std::expected<VersionRecord, std::string> Parse(std::string_view text) const;

    // Missing file -> ErrorKind::Io with err == ENOENT; bad header -> ErrorKind::Parse.
    Result ParseFile(const std::string& path, VersionRecord& out) const;

    const std::string& FamilyToken() const { return family_token_; }

  private:
    std::string family_token_;
};

} // namespace userjs
