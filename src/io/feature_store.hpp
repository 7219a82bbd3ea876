#pragma once

#include "../core/record.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wakefeed {

// Attribute names every entry of a feature store carries.
inline constexpr const char* ATTR_IS_HOTWORD   = "is_hotword";
inline constexpr const char* ATTR_SPEECH_START = "speech_start_ts";
inline constexpr const char* ATTR_SPEECH_END   = "speech_end_ts";

// ---------------------------------------------------------------------------
// FeatureStore: read-only, key-addressed source of pre-extracted features.
//
// Each key maps to a 2D numeric payload [time_steps, num_features] and a set
// of integer attributes (see ATTR_* above).
//
// Implementations: Hdf5FeatureStore, MemoryFeatureStore.
// All methods throw LoadError on failure.
// ---------------------------------------------------------------------------
class FeatureStore {
public:
    virtual ~FeatureStore() = default;

    // Keys in the store's native iteration order.
    virtual std::vector<std::string> keys() const = 0;

    // Payload of `key`, converted to float32.
    virtual FeatureMatrix read_features(const std::string& key) const = 0;

    // Integer attribute `name` of `key`.
    virtual int64_t read_attribute(const std::string& key,
                                   const std::string& name) const = 0;

    // Human-readable origin (file path, "<memory>", ...), used for logging.
    virtual std::string source() const = 0;
};

} // namespace wakefeed
