#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace userjs {

struct PreferenceEntry {
    std::string key;
    std::string value; // raw expression text, never interpreted

    bool operator==(const PreferenceEntry&) const = default;
};

// Key-unique preference map that iterates in order of first insertion.
// Re-inserting a key replaces its value but keeps its position.
class PreferenceSet {
  public:
    void Upsert(std::string key, std::string value);
    void Upsert(PreferenceEntry entry) { Upsert(std::move(entry.key), std::move(entry.value)); }

    const std::string* Find(std::string_view key) const;
    bool Contains(std::string_view key) const { return Find(key) != nullptr; }

    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

    const std::vector<PreferenceEntry>& Entries() const { return entries_; }

  private:
    std::vector<PreferenceEntry> entries_;
    std::unordered_map<std::string, size_t> index_by_key_;
};

} // namespace userjs
