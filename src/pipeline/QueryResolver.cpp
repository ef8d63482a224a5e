#include "pipeline/QueryResolver.hpp"
#include "core/Errors.hpp"
#include "index/IndexBuilder.hpp"
#include "index/VectorIndex.hpp"

#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace pipeline {

std::vector<Neighbor> resolve_query(const std::vector<float>& query,
                                    const fs::path& artifact_path,
                                    store::ProfileStore* store,
                                    int top_k) {
    if (top_k <= 0) {
        throw core::ConfigurationError("top_k must be greater than 0 (got " + std::to_string(top_k) + ")");
    }

    const knn::VectorIndex idx = knn::VectorIndex::load(artifact_path.string());
    if (idx.size() == 0) throw core::NotFoundError("index artifact is empty: " + artifact_path.string());

    const size_t effective_k = std::min((size_t)top_k, idx.size());
    if (query.size() != idx.dim()) throw core::DimensionMismatchError(idx.dim(), query.size());

    const std::vector<knn::L2Hit> hits = idx.search(query, effective_k);

    std::vector<store::IndexedProfile> mapped;
    if (store) mapped = store->lookup_by_artifact(knn::artifact_ref(artifact_path));

    std::vector<Neighbor> out;
    out.reserve(hits.size());
    for (size_t i = 0; i < hits.size(); ++i) {
        Neighbor n;
        n.rank = i + 1;
        n.distance = hits[i].distance;
        n.position = hits[i].position;
        if (n.position < mapped.size()) n.profile = mapped[n.position];
        out.push_back(std::move(n));
    }
    return out;
}

std::vector<Neighbor> resolve_query(const std::vector<float>& query,
                                    const fs::path& artifact_path,
                                    const std::optional<fs::path>& store_path,
                                    int top_k) {
    if (!store_path) return resolve_query(query, artifact_path, nullptr, top_k);

    if (!fs::exists(*store_path)) {
        std::cerr << "[warn] mapping store not found, results stay unresolved: " << store_path->string() << "\n";
        return resolve_query(query, artifact_path, nullptr, top_k);
    }

    store::ProfileStore st = store::ProfileStore::open_read_only(*store_path);
    return resolve_query(query, artifact_path, &st, top_k);
}

} // namespace pipeline
