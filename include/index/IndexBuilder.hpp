#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace knn {

// Writes one immutable flat-L2 artifact per batch into index_dir, named
// resume_profiles_<YYYYMMDDTHHMMSSZ>.ridx (UTC). If that second is already
// taken, the next free second is used, so lexical and chronological order agree.
class IndexBuilder {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit IndexBuilder(std::filesystem::path index_dir, Clock clock = nullptr);

    // Throws core::ValidationError on an empty batch, zero dimension, or a
    // vector whose length differs from the first. The file appears only once
    // fully written. Returns the artifact path (absolute, normalized).
    std::filesystem::path build(const std::vector<std::vector<float>>& vectors) const;

    const std::filesystem::path& index_dir() const { return m_dir; }

private:
    std::filesystem::path m_dir;
    Clock m_clock;
};

std::string artifact_file_name(std::chrono::system_clock::time_point tp);

// Form under which artifacts are recorded in, and looked up from, the store.
std::string artifact_ref(const std::filesystem::path& p);

} // namespace knn
