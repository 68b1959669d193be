#include "userjs/header_parser.hpp"

#include "userjs/text_file.hpp"

#include <cstring>
#include <sstream>
#include <utility>

namespace userjs {

namespace {

struct HeaderField {
    const char* marker;
    const char* label;
};

constexpr HeaderField kFields[] = {
    {"name: ", "name"},
    {"date: ", "date"},
    {"version ", "version"},
};

void StripLineEnding(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
}

std::expected<std::string, std::string> ExtractField(std::istream& in,
                                                     int line_no,
                                                     const HeaderField& field) {
    std::string line;
    if (!std::getline(in, line)) {
        return std::unexpected("header truncated: missing line " + std::to_string(line_no) +
                               " (" + field.label + ")");
    }
    StripLineEnding(line);

    const size_t pos = line.find(field.marker);
    if (pos == std::string::npos) {
        return std::unexpected("header line " + std::to_string(line_no) + " has no '" +
                               field.marker + "' marker");
    }
    return line.substr(pos + std::strlen(field.marker));
}

} // namespace

std::string VersionRecord::ToString() const { return name + ": " + version + " from " + date; }

HeaderParser::HeaderParser(std::string family_token) : family_token_(std::move(family_token)) {}

std::expected<VersionRecord, std::string> HeaderParser::Parse(std::istream& in) const {
    std::string opener;
    if (!std::getline(in, opener)) {
        return std::unexpected("header truncated: empty input");
    }

    std::string values[3];
    for (int i = 0; i < 3; ++i) {
        auto v = ExtractField(in, i + 2, kFields[i]);
        if (!v) return std::unexpected(v.error());
        values[i] = std::move(*v);
    }

    if (values[0].find(family_token_) == std::string::npos) {
        return std::unexpected("Version not recognized");
    }

    return VersionRecord{
        .name = std::move(values[0]),
        .version = std::move(values[2]),
        .date = std::move(values[1]),
    };
}

std::expected<VersionRecord, std::string> HeaderParser::Parse(std::string_view text) const {
    std::istringstream in{std::string(text)};
    return Parse(in);
}

Result HeaderParser::ParseFile(const std::string& path, VersionRecord& out) const {
    std::string text;
    auto rr = ReadTextFile(path, text);
    if (!rr.is_ok()) return rr;

    auto parsed = Parse(text);
    if (!parsed) {
        return Result::Fail(ErrorKind::Parse, parsed.error() + " in " + path);
    }

    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace userjs
