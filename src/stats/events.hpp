#pragma once

#include <cstddef>
#include <string>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Event types emitted on the EventBus by the data pipeline.
// All events are small, copyable value types.
// ---------------------------------------------------------------------------

// Emitted by load_records() once every record of a store is in memory.
struct DatasetLoadedEvent {
    std::string source;
    size_t      num_records   = 0;
    size_t      num_wakewords = 0;
};

// Emitted by SequenceDataset::prune_positive_class().
struct DatasetPrunedEvent {
    double keep_ratio  = 0.0;
    size_t removed     = 0;    // positives taken out of the dataset
    size_t retained    = 0;    // positives appended back
    size_t num_records = 0;    // dataset size after pruning
    size_t num_batches = 0;
};

// Emitted by SequenceDataset::on_epoch_end().
struct DatasetEpochEndEvent {
    size_t epoch    = 0;       // 0-indexed epoch that just finished
    bool   shuffled = false;
};

// Emitted by SequenceDataset::get_batch() after padding.
struct BatchServedEvent {
    size_t index      = 0;
    size_t batch_size = 0;
    size_t max_length = 0;     // padded time dimension
};

} // namespace wakefeed
