#pragma once

#include "feature_store.hpp"

#include <H5Cpp.h>

#include <string>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Hdf5FeatureStore: reads pre-extracted features from an HDF5 file.
//
// Layout (one dataset per example, directly under the root group):
//   /<file_name>                 dataset, 2D numeric [time_steps, num_features]
//     @is_hotword                integer attribute, 0 or 1
//     @speech_start_ts           integer attribute
//     @speech_end_ts             integer attribute
//
// Keys are returned in the root group's link order (by name, which is what
// HDF5 uses unless creation order tracking was enabled).
//
// The file stays open for the lifetime of the store. Every HDF5 failure is
// rethrown as LoadError with the path and key in the message.
// ---------------------------------------------------------------------------
class Hdf5FeatureStore : public FeatureStore {
public:
    explicit Hdf5FeatureStore(const std::string& path);

    std::vector<std::string> keys() const override;
    FeatureMatrix read_features(const std::string& key) const override;
    int64_t read_attribute(const std::string& key,
                           const std::string& name) const override;
    std::string source() const override { return path_; }

    Hdf5FeatureStore(const Hdf5FeatureStore&) = delete;
    Hdf5FeatureStore& operator=(const Hdf5FeatureStore&) = delete;

private:
    H5::DataSet open_dataset(const std::string& key) const;

    std::string path_;
    H5::H5File  file_;
};

} // namespace wakefeed
