#pragma once

#include "userjs/preference_set.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace userjs {

// Length of the upstream comment banner that is carried over verbatim.
inline constexpr size_t kHeaderLines = 76;
inline constexpr std::string_view kPrefPrefix = "user_pref(";

// Splits on '\n', dropping a trailing '\r' per line; a final newline does not
// yield an empty last line.
std::vector<std::string_view> SplitLines(std::string_view text);

class PreferenceMerger {
  public:
    explicit PreferenceMerger(size_t header_lines = kHeaderLines);

    // `line` must start with kPrefPrefix. The pair is taken from the text up to
    // the first ')' and split at the first ','.
    static std::expected<PreferenceEntry, std::string> ExtractPreference(std::string_view line);

    static std::string Serialize(const PreferenceEntry& entry);

    // Adds every declaration in `text` to `out`, later ones replacing earlier ones.
    // `origin` names the document in error messages.
    static std::expected<void, std::string> CollectPreferences(std::string_view text,
                                                               const char* origin,
                                                               PreferenceSet& out);

    // Header block of `base`, a blank line, then the union of both documents'
    // declarations with `overrides` winning on conflicts.
    std::expected<std::string, std::string> Merge(std::string_view base,
                                                  std::string_view overrides) const;

  private:
    size_t header_lines_;
};

} // namespace userjs
