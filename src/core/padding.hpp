#pragma once

#include "record.hpp"
#include "tensor.hpp"

#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// pad_sequences: stack variable-length feature matrices into one
// zero-filled float32 tensor of shape [n, max_time_steps, feature_width].
//
//   max_time_steps = largest time_steps in the list
//   feature_width  = num_features of the FIRST matrix
//
// Each matrix is copied into the top-left corner of its slot; padding goes
// after the last time step and to the right of the last feature.
//
// Widths are not validated. A narrower matrix fills its leading columns and
// a wider one is truncated to feature_width.
//
// Throws std::invalid_argument on an empty list.
// ---------------------------------------------------------------------------
Tensor pad_sequences(const std::vector<const FeatureMatrix*>& sequences);

} // namespace wakefeed
