#pragma once

#include "feature_store.hpp"

#include <map>
#include <string>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// MemoryFeatureStore: FeatureStore backed by in-process entries.
// Keys iterate in insertion order. Used for synthetic data and tests.
// ---------------------------------------------------------------------------
class MemoryFeatureStore : public FeatureStore {
public:
    struct Entry {
        std::string                    key;
        FeatureMatrix                  features;
        std::map<std::string, int64_t> attributes;
    };

    explicit MemoryFeatureStore(std::string name = "<memory>");

    // Adds an entry with the three standard attributes set.
    // Throws std::invalid_argument if the key is already present.
    void add(const std::string& key, FeatureMatrix features,
             int64_t is_hotword, int64_t speech_start, int64_t speech_end);

    // Adds an entry with an arbitrary attribute set.
    void add(Entry entry);

    std::vector<std::string> keys() const override;
    FeatureMatrix read_features(const std::string& key) const override;
    int64_t read_attribute(const std::string& key,
                           const std::string& name) const override;
    std::string source() const override { return name_; }

    size_t size() const { return entries_.size(); }

private:
    const Entry& find(const std::string& key) const;

    std::string        name_;
    std::vector<Entry> entries_;
};

} // namespace wakefeed
