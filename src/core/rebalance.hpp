#pragma once

#include "record.hpp"

#include <cstddef>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Building blocks of SequenceDataset::prune_positive_class().
// ---------------------------------------------------------------------------

// Moves every wakeword (label == 1) out of `records` in two passes: a mark
// pass over ascending indices, then a single compaction pass. The remaining
// records keep their relative order.
//
// The returned wakewords are ordered by DESCENDING original index, the order
// in which deleting them one at a time from the back would visit them.
std::vector<Record> extract_wakewords(std::vector<Record>& records);

// Length of the prefix [:n] of a list of `available` items, with
// n = trunc(count). Negative n drops |n| items from the end.
// Caller guarantees `count` is finite.
size_t slice_count(double count, size_t available);

} // namespace wakefeed
