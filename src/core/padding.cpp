#include "padding.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace wakefeed {

Tensor pad_sequences(const std::vector<const FeatureMatrix*>& sequences) {
    if (sequences.empty())
        throw std::invalid_argument("pad_sequences: empty sequence list");

    size_t max_length = 0;
    for (const FeatureMatrix* m : sequences)
        max_length = std::max(max_length, m->time_steps);

    const size_t width = sequences.front()->num_features;

    Tensor out = Tensor::make({sequences.size(), max_length, width}, DType::Float32);
    if (out.numel() == 0) return out;

    float* dst = out.data_as<float>();
    const size_t slot = max_length * width;

    for (size_t i = 0; i < sequences.size(); ++i) {
        const FeatureMatrix& m = *sequences[i];
        const size_t cols = std::min(width, m.num_features);
        if (cols == 0) continue;

        float* base = dst + i * slot;
        for (size_t t = 0; t < m.time_steps; ++t) {
            std::memcpy(base + t * width,
                        m.values.data() + t * m.num_features,
                        cols * sizeof(float));
        }
    }
    return out;
}

} // namespace wakefeed
