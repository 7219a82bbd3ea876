#include "memory_feature_store.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace wakefeed {

MemoryFeatureStore::MemoryFeatureStore(std::string name)
    : name_(std::move(name)) {}

void MemoryFeatureStore::add(const std::string& key, FeatureMatrix features,
                             int64_t is_hotword, int64_t speech_start,
                             int64_t speech_end) {
    Entry e;
    e.key      = key;
    e.features = std::move(features);
    e.attributes[ATTR_IS_HOTWORD]   = is_hotword;
    e.attributes[ATTR_SPEECH_START] = speech_start;
    e.attributes[ATTR_SPEECH_END]   = speech_end;
    add(std::move(e));
}

void MemoryFeatureStore::add(Entry entry) {
    auto dup = std::find_if(entries_.begin(), entries_.end(),
                            [&](const Entry& e) { return e.key == entry.key; });
    if (dup != entries_.end())
        throw std::invalid_argument("MemoryFeatureStore: duplicate key " + entry.key);
    entries_.push_back(std::move(entry));
}

std::vector<std::string> MemoryFeatureStore::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.key);
    return out;
}

const MemoryFeatureStore::Entry& MemoryFeatureStore::find(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.key == key; });
    if (it == entries_.end())
        throw LoadError("MemoryFeatureStore: missing key " + key);
    return *it;
}

FeatureMatrix MemoryFeatureStore::read_features(const std::string& key) const {
    const FeatureMatrix& m = find(key).features;
    if (m.values.size() != m.time_steps * m.num_features)
        throw LoadError("MemoryFeatureStore: payload of " + key +
                        " has " + std::to_string(m.values.size()) +
                        " values, expected " +
                        std::to_string(m.time_steps * m.num_features));
    return m;
}

int64_t MemoryFeatureStore::read_attribute(const std::string& key,
                                           const std::string& name) const {
    const Entry& e = find(key);
    auto it = e.attributes.find(name);
    if (it == e.attributes.end())
        throw LoadError("MemoryFeatureStore: " + key + " has no attribute " + name);
    return it->second;
}

} // namespace wakefeed
