#include "userjs/preference_set.hpp"

#include <utility>

namespace userjs {

void PreferenceSet::Upsert(std::string key, std::string value) {
    auto it = index_by_key_.find(key);
    if (it != index_by_key_.end()) {
        entries_[it->second].value = std::move(value);
        return;
    }

    index_by_key_.emplace(key, entries_.size());
    entries_.push_back(PreferenceEntry{.key = std::move(key), .value = std::move(value)});
}

const std::string* PreferenceSet::Find(std::string_view key) const {
    auto it = index_by_key_.find(std::string(key));
    if (it == index_by_key_.end())
        return nullptr;
    return &entries_[it->second].value;
}

} // namespace userjs
