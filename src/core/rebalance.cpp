#include "rebalance.hpp"

#include <cmath>

namespace wakefeed {

std::vector<Record> extract_wakewords(std::vector<Record>& records) {
    std::vector<size_t> positive;
    std::vector<bool>   keep(records.size(), true);
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].label == 1) {
            positive.push_back(i);
            keep[i] = false;
        }
    }

    std::vector<Record> removed;
    removed.reserve(positive.size());
    for (auto it = positive.rbegin(); it != positive.rend(); ++it)
        removed.push_back(std::move(records[*it]));

    std::vector<Record> compacted;
    compacted.reserve(records.size() - positive.size());
    for (size_t i = 0; i < records.size(); ++i)
        if (keep[i]) compacted.push_back(std::move(records[i]));

    records = std::move(compacted);
    return removed;
}

size_t slice_count(double count, size_t available) {
    const double n     = std::trunc(count);
    const double avail = static_cast<double>(available);
    if (n >= 0.0) return n >= avail ? available : static_cast<size_t>(n);
    return -n >= avail ? 0 : available - static_cast<size_t>(-n);
}

} // namespace wakefeed
