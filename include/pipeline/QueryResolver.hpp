#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "store/ProfileStore.hpp"

namespace pipeline {

struct Neighbor {
    size_t rank = 0;          // 1-based
    float distance = 0.0f;    // squared L2
    size_t position = 0;      // slot within the artifact
    // present only when the position maps to a store row
    std::optional<store::IndexedProfile> profile;
};

// Exhaustive search over one artifact, joined back to store rows by position.
//
// Throws core::ConfigurationError (top_k <= 0), core::NotFoundError (missing or
// empty artifact), core::DimensionMismatchError (query vs artifact dimension).
// Positions with no matching row are returned unresolved.
std::vector<Neighbor> resolve_query(const std::vector<float>& query,
                                    const std::filesystem::path& artifact_path,
                                    store::ProfileStore* store,
                                    int top_k);

// Opens the store at store_path when given. A store path that does not exist
// is reported as a warning and the results stay unresolved.
std::vector<Neighbor> resolve_query(const std::vector<float>& query,
                                    const std::filesystem::path& artifact_path,
                                    const std::optional<std::filesystem::path>& store_path,
                                    int top_k);

} // namespace pipeline
