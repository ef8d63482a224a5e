#include "index/VectorIndex.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace knn {

static const char kMagic[4] = {'R', 'I', 'D', 'X'};
static const uint32_t kVersion = 1;

void VectorIndex::add(const std::vector<float>& v) {
    if (m_dim == 0 || v.size() != m_dim) {
        throw core::ValidationError("vector of dimension " + std::to_string(v.size()) +
                                    " added to index of dimension " + std::to_string(m_dim));
    }
    m_vecs.insert(m_vecs.end(), v.begin(), v.end());
}

float VectorIndex::l2sq(const float* a, const float* b, size_t dim) {
    double acc = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double d = (double)a[i] - (double)b[i];
        acc += d * d;
    }
    return (float)acc;
}

std::vector<L2Hit> VectorIndex::search(const std::vector<float>& query, size_t k) const {
    if (query.size() != m_dim) throw core::DimensionMismatchError(m_dim, query.size());

    const size_t n = size();
    std::vector<L2Hit> hits;
    hits.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        hits.push_back({i, l2sq(query.data(), &m_vecs[i * m_dim], m_dim)});
    }

    const size_t kk = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + (std::ptrdiff_t)kk, hits.end(),
                      [](const L2Hit& a, const L2Hit& b) {
                          if (a.distance != b.distance) return a.distance < b.distance;
                          return a.position < b.position;
                      });
    hits.resize(kk);
    return hits;
}

void VectorIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw core::ValidationError("failed to open index file for writing: " + path);

    uint32_t dim = (uint32_t)m_dim;
    uint64_t n = (uint64_t)size();
    out.write(kMagic, sizeof(kMagic));
    out.write((const char*)&kVersion, sizeof(kVersion));
    out.write((const char*)&dim, sizeof(dim));
    out.write((const char*)&n, sizeof(n));
    out.write((const char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    out.flush();
    if (!out) throw core::ValidationError("failed to write index file: " + path);
}

VectorIndex VectorIndex::load(const std::string& path) {
    if (!std::filesystem::exists(path)) throw core::NotFoundError("index artifact not found: " + path);

    std::ifstream in(path, std::ios::binary);
    if (!in) throw core::NotFoundError("index artifact cannot be opened: " + path);

    char magic[4] = {};
    uint32_t version = 0, dim = 0;
    uint64_t n = 0;
    in.read(magic, sizeof(magic));
    in.read((char*)&version, sizeof(version));
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw core::ValidationError("not an index artifact: " + path);
    }
    if (version != kVersion) {
        throw core::ValidationError("unsupported index artifact version " + std::to_string(version) + ": " + path);
    }

    const uint64_t header = sizeof(kMagic) + sizeof(version) + sizeof(dim) + sizeof(n);
    const uint64_t file_size = (uint64_t)std::filesystem::file_size(path);
    if (n > 0 && dim == 0) throw core::ValidationError("index artifact has zero dimension: " + path);
    if (dim > 0 && n > (file_size - header) / ((uint64_t)dim * sizeof(float))) {
        throw core::ValidationError("index artifact is truncated: " + path);
    }
    if (file_size != header + n * (uint64_t)dim * sizeof(float)) {
        throw core::ValidationError("index artifact size does not match its header: " + path);
    }

    VectorIndex idx(dim);
    idx.m_vecs.resize((size_t)(n * dim));
    in.read((char*)idx.m_vecs.data(), (std::streamsize)(sizeof(float) * idx.m_vecs.size()));
    if (!in) throw core::ValidationError("failed to read index artifact: " + path);
    return idx;
}

} // namespace knn
