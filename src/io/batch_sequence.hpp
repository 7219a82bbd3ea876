#pragma once

#include "../core/tensor.hpp"

#include <cstddef>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Batch: a single padded mini-batch.
// ---------------------------------------------------------------------------
struct Batch {
    Tensor inputs;   // float32 [batch_size, max_time_steps, feature_width]
    Tensor targets;  // uint8   [batch_size]
};

// ---------------------------------------------------------------------------
// BatchSequence: random-access view of a dataset as a list of batches.
//
// A training loop calls get_batch(i) for i in [0, length()) and then
// on_epoch_end() once per epoch.
//
// Implementations: SequenceDataset.
// ---------------------------------------------------------------------------
class BatchSequence {
public:
    virtual ~BatchSequence() = default;

    // Number of batches per epoch.
    virtual size_t length() const = 0;

    // Batch `index`. Throws std::out_of_range for index >= length().
    virtual Batch get_batch(size_t index) = 0;

    // Called by the training loop after the last batch of each epoch.
    virtual void on_epoch_end() {}
};

} // namespace wakefeed
