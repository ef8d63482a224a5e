#include "emb/Pooling.hpp"

#include <cmath>

namespace emb {

void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<std::vector<float>> masked_mean_pool(const float* hidden,
                                                 const std::vector<int64_t>& mask,
                                                 size_t batch, size_t seq_len, size_t dim) {
    std::vector<std::vector<float>> out(batch, std::vector<float>(dim, 0.0f));

    for (size_t b = 0; b < batch; ++b) {
        std::vector<double> acc(dim, 0.0);
        size_t used = 0;
        for (size_t t = 0; t < seq_len; ++t) {
            if (mask[b * seq_len + t] == 0) continue;
            ++used;
            const float* row = hidden + (b * seq_len + t) * dim;
            for (size_t j = 0; j < dim; ++j) acc[j] += row[j];
        }
        if (used == 0) continue;

        for (size_t j = 0; j < dim; ++j) out[b][j] = (float)(acc[j] / (double)used);
        l2_normalize(out[b]);
    }
    return out;
}

} // namespace emb
