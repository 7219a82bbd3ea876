#pragma once

#include "batch_sequence.hpp"
#include "feature_store.hpp"
#include "record_loader.hpp"
#include "../core/record.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// DatasetConfig: construction-time settings of a SequenceDataset.
// ---------------------------------------------------------------------------
struct DatasetConfig {
    size_t   batch_size   = 32;
    size_t   num_features = 40;     // expected width; not checked against data
    bool     shuffle      = false;  // reshuffle in on_epoch_end()
    uint64_t seed         = 0;      // seeds every random permutation
    bool     verbose      = true;   // print load progress
};

// ---------------------------------------------------------------------------
// SequenceDataset: in-memory wake-word dataset served as padded batches.
//
// All records are loaded eagerly at construction. Batch i is the contiguous
// slice [i*batch_size, (i+1)*batch_size) of the current record order, padded
// with pad_sequences(). A trailing partial batch is never served.
//
// Two wakeword counts exist and are deliberately separate:
//   count_wakewords_at_load()  fixed when the store was read; it is also the
//                              baseline for every prune_positive_class() call
//   count_wakewords()          recomputed from the current records
//
// Single-threaded. Callers must not prune or shuffle while a get_batch() is
// in flight.
// ---------------------------------------------------------------------------
class SequenceDataset : public BatchSequence {
public:
    // Throws std::invalid_argument if cfg.batch_size == 0, LoadError if the
    // store cannot be read.
    explicit SequenceDataset(const FeatureStore& store, DatasetConfig cfg = {});

    // Opens `h5_path` with Hdf5FeatureStore.
    explicit SequenceDataset(const std::string& h5_path, DatasetConfig cfg = {});

    // BatchSequence interface
    size_t length() const override { return num_batches_; }
    Batch  get_batch(size_t index) override;
    void   on_epoch_end() override;

    // Down-sample the positive class.
    //
    // Every wakeword is taken out, the removed set is permuted, and the first
    // int(keep_ratio * count_wakewords_at_load()) of them are appended back.
    // The whole dataset is then permuted and length() recomputed. Negatives
    // are never dropped.
    //
    // keep_ratio is not range checked. The retained count follows slice
    // semantics: more than available keeps everything, a negative count -k
    // keeps all but the last k. Since the baseline is the load-time count,
    // repeated calls compound against a stale number.
    //
    // Throws std::invalid_argument only if keep_ratio is not finite.
    void prune_positive_class(double keep_ratio);
    void prune_positive_class(double keep_ratio, std::mt19937_64& rng);

    // Labels / file names in current order.
    // Throw PreconditionError whenever shuffling is enabled.
    std::vector<uint8_t>     get_labels() const;
    std::vector<std::string> get_filenames() const;

    size_t count_records() const { return records_.size(); }
    size_t count_wakewords_at_load() const { return num_wakewords_; }
    size_t count_wakewords() const;

    const std::vector<Record>& records() const { return records_; }

    size_t batch_size()      const { return cfg_.batch_size; }
    size_t num_features()    const { return cfg_.num_features; }
    bool   shuffle_enabled() const { return cfg_.shuffle; }
    size_t epochs_completed() const { return epoch_; }

private:
    SequenceDataset(LoadResult loaded, DatasetConfig cfg);

    static const DatasetConfig& check_config(const DatasetConfig& cfg);
    void require_stable_order(const char* accessor) const;

    DatasetConfig       cfg_;
    std::vector<Record> records_;
    const size_t        num_wakewords_;
    size_t              num_batches_ = 0;
    size_t              epoch_       = 0;
    std::mt19937_64     rng_;
};

} // namespace wakefeed
