#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// FeatureMatrix: row-major [time_steps, num_features] float32 block.
// time_steps varies per record; num_features is fixed across a dataset.
// ---------------------------------------------------------------------------
struct FeatureMatrix {
    size_t             time_steps   = 0;
    size_t             num_features = 0;
    std::vector<float> values;   // time_steps * num_features

    float at(size_t t, size_t f) const { return values[t * num_features + f]; }
};

// ---------------------------------------------------------------------------
// Record: one labelled example as loaded from a feature store.
// ---------------------------------------------------------------------------
struct Record {
    std::string   file_name;
    uint8_t       label        = 0;   // 1 = wakeword
    int16_t       start_speech = 0;   // informational only
    int16_t       end_speech   = 0;
    FeatureMatrix features;

    bool is_wakeword() const noexcept { return label == 1; }
};

} // namespace wakefeed
