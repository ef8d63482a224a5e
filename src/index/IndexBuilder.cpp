#include "index/IndexBuilder.hpp"
#include "core/Errors.hpp"
#include "index/VectorIndex.hpp"
#include "util/TimeUtil.hpp"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace knn {

static const char* kPrefix = "resume_profiles_";
static const char* kSuffix = ".ridx";

std::string artifact_file_name(std::chrono::system_clock::time_point tp) {
    return std::string(kPrefix) + timeutil::utc_compact(tp) + kSuffix;
}

std::string artifact_ref(const fs::path& p) {
    return fs::absolute(p).lexically_normal().string();
}

IndexBuilder::IndexBuilder(fs::path index_dir, Clock clock)
    : m_dir(fs::absolute(std::move(index_dir)).lexically_normal()), m_clock(std::move(clock)) {
    if (!m_clock) m_clock = [] { return std::chrono::system_clock::now(); };
}

fs::path IndexBuilder::build(const std::vector<std::vector<float>>& vectors) const {
    if (vectors.empty()) {
        throw core::ValidationError("no embeddings provided; cannot build index");
    }

    const size_t dim = vectors[0].size();
    if (dim == 0) throw core::ValidationError("embedding vector size cannot be zero");

    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim) {
            std::ostringstream oss;
            oss << "embedding at position " << i << " has dimension " << vectors[i].size()
                << "; expected " << dim;
            throw core::ValidationError(oss.str());
        }
    }

    VectorIndex idx(dim);
    for (const auto& v : vectors) idx.add(v);

    fs::create_directories(m_dir);

    auto tp = m_clock();
    fs::path target = m_dir / artifact_file_name(tp);
    while (fs::exists(target)) {
        tp += std::chrono::seconds(1);
        target = m_dir / artifact_file_name(tp);
    }

    fs::path tmp = target;
    tmp += ".tmp";
    try {
        idx.save(tmp.string());
        fs::rename(tmp, target);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    return target;
}

} // namespace knn
