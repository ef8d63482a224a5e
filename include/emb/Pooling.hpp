#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace emb {

// hidden is the model's last hidden state, row-major [batch, seq_len, dim];
// mask is [batch, seq_len]. One mean over the unmasked tokens per row,
// L2-normalized. A row with no unmasked token pools to all zeros.
std::vector<std::vector<float>> masked_mean_pool(const float* hidden,
                                                 const std::vector<int64_t>& mask,
                                                 size_t batch, size_t seq_len, size_t dim);

// no-op on an all-zero vector
void l2_normalize(std::vector<float>& v);

} // namespace emb
