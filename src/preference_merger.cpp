#include "userjs/preference_merger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace userjs {

namespace {

constexpr std::string_view kBlank = " \t";

std::string_view Trim(std::string_view s) {
    const size_t b = s.find_first_not_of(kBlank);
    if (b == std::string_view::npos) return {};
    const size_t e = s.find_last_not_of(kBlank);
    return s.substr(b, e - b + 1);
}

std::string_view StripQuotes(std::string_view s) {
    while (!s.empty() && s.front() == '"') s.remove_prefix(1);
    while (!s.empty() && s.back() == '"') s.remove_suffix(1);
    return Trim(s);
}

} // namespace

std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);

        start = end + 1;
    }
    return lines;
}

PreferenceMerger::PreferenceMerger(size_t header_lines) : header_lines_(header_lines) {}

std::expected<PreferenceEntry, std::string> PreferenceMerger::ExtractPreference(std::string_view line) {
    if (!line.starts_with(kPrefPrefix)) {
        return std::unexpected("not a preference declaration");
    }

    std::string_view body = line.substr(kPrefPrefix.size());
    const size_t close = body.find(')');
    if (close == std::string_view::npos) {
        return std::unexpected("missing closing parenthesis");
    }
    body = body.substr(0, close);

    const size_t comma = body.find(',');
    if (comma == std::string_view::npos) {
        return std::unexpected("missing ',' between key and value");
    }

    const std::string_view key = StripQuotes(Trim(body.substr(0, comma)));

    return PreferenceEntry{
        .key = std::string(key),
        .value = std::string(Trim(body.substr(comma + 1))),
    };
}

std::string PreferenceMerger::Serialize(const PreferenceEntry& entry) {
    std::string out;
    out.reserve(kPrefPrefix.size() + entry.key.size() + entry.value.size() + 6);
    out.append(kPrefPrefix);
    out.append("\"").append(entry.key).append("\", ");
    out.append(entry.value);
    out.append(");");
    return out;
}

std::expected<void, std::string> PreferenceMerger::CollectPreferences(std::string_view text,
                                                                      const char* origin,
                                                                      PreferenceSet& out) {
    const auto lines = SplitLines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!lines[i].starts_with(kPrefPrefix)) continue;

        auto entry = ExtractPreference(lines[i]);
        if (!entry) {
            return std::unexpected("malformed preference on line " + std::to_string(i + 1) +
                                   " of " + origin + ": " + std::string(lines[i]) + " (" +
                                   entry.error() + ")");
        }
        out.Upsert(std::move(*entry));
    }
    return {};
}

std::expected<std::string, std::string> PreferenceMerger::Merge(std::string_view base,
                                                                 std::string_view overrides) const {
    const auto base_lines = SplitLines(base);

    std::string out;
    const size_t header_count = std::min(header_lines_, base_lines.size());
    for (size_t i = 0; i < header_count; ++i) {
        if (i > 0) out.push_back('\n');
        out.append(base_lines[i]);
    }

    // The banner is scanned too: declarations inside it also land in the merged set.
    PreferenceSet prefs;
    if (auto r = CollectPreferences(base, "base", prefs); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = CollectPreferences(overrides, "overrides", prefs); !r) {
        return std::unexpected(r.error());
    }

    out.append("\n\n");
    bool first = true;
    for (const auto& entry : prefs.Entries()) {
        if (!first) out.push_back('\n');
        out.append(Serialize(entry));
        first = false;
    }
    return out;
}

} // namespace userjs
