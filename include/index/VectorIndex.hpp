#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace knn {

struct L2Hit {
    size_t position;   // insertion order within the index
    float distance;    // squared L2
};

// Exhaustive (flat) L2 index. Vectors are kept packed in insertion order;
// position i is the i-th vector added.
class VectorIndex {
public:
    explicit VectorIndex(size_t dim = 0) : m_dim(dim) {}

    // v.size() must equal dim(); throws core::ValidationError otherwise
    void add(const std::vector<float>& v);

    // k smallest distances, ascending, ties by lower position. k is clamped
    // to size(). Throws core::DimensionMismatchError on a wrong-sized query.
    std::vector<L2Hit> search(const std::vector<float>& query, size_t k) const;

    // binary artifact I/O: "RIDX", u32 version, u32 dim, u64 count, floats
    void save(const std::string& path) const;
    // core::NotFoundError if missing, core::ValidationError if malformed
    static VectorIndex load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_dim == 0 ? 0 : m_vecs.size() / m_dim; }

private:
    size_t m_dim = 0;
    std::vector<float> m_vecs; // packed: size = size()*dim()

    static float l2sq(const float* a, const float* b, size_t dim);
};

} // namespace knn
