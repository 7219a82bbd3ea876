#pragma once

#include "feature_store.hpp"
#include "../core/record.hpp"

#include <cstddef>
#include <vector>

namespace wakefeed {

struct LoadResult {
    std::vector<Record> records;        // store iteration order
    size_t              num_wakewords = 0;
};

// ---------------------------------------------------------------------------
// load_records: materialise every entry of `store` as a Record.
//
//   label        = uint8 conversion of @is_hotword
//   start_speech = int16 conversion of @speech_start_ts
//   end_speech   = int16 conversion of @speech_end_ts
//   features     = payload as float32
//
// num_wakewords counts entries whose raw @is_hotword equals 1.
//
// Throws LoadError on the first malformed entry; nothing is returned in that
// case. Emits DatasetLoadedEvent on success. With verbose set, progress is
// printed to stdout.
// ---------------------------------------------------------------------------
LoadResult load_records(const FeatureStore& store, bool verbose = true);

} // namespace wakefeed
