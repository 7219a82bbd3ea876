#include "sequence_dataset.hpp"
#include "errors.hpp"
#include "hdf5_feature_store.hpp"
#include "../core/padding.hpp"
#include "../core/rebalance.hpp"
#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <stdexcept>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
const DatasetConfig& SequenceDataset::check_config(const DatasetConfig& cfg) {
    if (cfg.batch_size == 0)
        throw std::invalid_argument("SequenceDataset: batch_size must be > 0");
    return cfg;
}

SequenceDataset::SequenceDataset(const FeatureStore& store, DatasetConfig cfg)
    : SequenceDataset(load_records(store, check_config(cfg).verbose), cfg) {}

SequenceDataset::SequenceDataset(const std::string& h5_path, DatasetConfig cfg)
    : SequenceDataset(Hdf5FeatureStore(h5_path), cfg) {}

SequenceDataset::SequenceDataset(LoadResult loaded, DatasetConfig cfg)
    : cfg_(cfg)
    , records_(std::move(loaded.records))
    , num_wakewords_(loaded.num_wakewords)
    , num_batches_(records_.size() / cfg.batch_size)
    , rng_(cfg.seed)
{}

// ---------------------------------------------------------------------------
// Batch assembly
// ---------------------------------------------------------------------------
Batch SequenceDataset::get_batch(size_t index) {
    if (index >= num_batches_)
        throw std::out_of_range("SequenceDataset: batch index " + std::to_string(index) +
                                " out of range [0, " + std::to_string(num_batches_) + ")");

    const size_t bs    = cfg_.batch_size;
    const size_t start = index * bs;

    std::vector<const FeatureMatrix*> features;
    features.reserve(bs);
    Tensor targets = Tensor::make({bs}, DType::UInt8);
    uint8_t* labels = targets.data_as<uint8_t>();

    for (size_t i = 0; i < bs; ++i) {
        const Record& rec = records_[start + i];
        features.push_back(&rec.features);
        labels[i] = rec.label;
    }

    Batch batch{ pad_sequences(features), std::move(targets) };

    BatchServedEvent ev;
    ev.index      = index;
    ev.batch_size = bs;
    ev.max_length = batch.inputs.shape[1];
    EventBus::instance().emit(ev);

    return batch;
}

void SequenceDataset::on_epoch_end() {
    if (cfg_.shuffle) std::shuffle(records_.begin(), records_.end(), rng_);

    DatasetEpochEndEvent ev;
    ev.epoch    = epoch_++;
    ev.shuffled = cfg_.shuffle;
    EventBus::instance().emit(ev);
}

// ---------------------------------------------------------------------------
// Rebalancing
// ---------------------------------------------------------------------------
void SequenceDataset::prune_positive_class(double keep_ratio) {
    prune_positive_class(keep_ratio, rng_);
}

void SequenceDataset::prune_positive_class(double keep_ratio, std::mt19937_64& rng) {
    const double wanted = keep_ratio * static_cast<double>(num_wakewords_);
    if (!std::isfinite(wanted))
        throw std::invalid_argument("SequenceDataset: keep_ratio must be finite");

    std::vector<Record> removed = extract_wakewords(records_);
    const size_t num_removed = removed.size();

    std::shuffle(removed.begin(), removed.end(), rng);

    const size_t retained = slice_count(wanted, removed.size());
    records_.insert(records_.end(),
                    std::make_move_iterator(removed.begin()),
                    std::make_move_iterator(removed.begin() + static_cast<std::ptrdiff_t>(retained)));

    // Retained wakewords would otherwise all sit at the end.
    std::shuffle(records_.begin(), records_.end(), rng);

    num_batches_ = records_.size() / cfg_.batch_size;

    DatasetPrunedEvent ev;
    ev.keep_ratio  = keep_ratio;
    ev.removed     = num_removed;
    ev.retained    = retained;
    ev.num_records = records_.size();
    ev.num_batches = num_batches_;
    EventBus::instance().emit(ev);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
void SequenceDataset::require_stable_order(const char* accessor) const {
    if (cfg_.shuffle)
        throw PreconditionError(std::string("SequenceDataset::") + accessor +
                                ": order may not be correct due to shuffling being enabled");
}

std::vector<uint8_t> SequenceDataset::get_labels() const {
    require_stable_order("get_labels");
    std::vector<uint8_t> out;
    out.reserve(records_.size());
    for (const Record& r : records_) out.push_back(r.label);
    return out;
}

std::vector<std::string> SequenceDataset::get_filenames() const {
    require_stable_order("get_filenames");
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const Record& r : records_) out.push_back(r.file_name);
    return out;
}

size_t SequenceDataset::count_wakewords() const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                             [](const Record& r) { return r.is_wakeword(); }));
}

} // namespace wakefeed
