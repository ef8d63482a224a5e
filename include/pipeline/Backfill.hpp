#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "emb/EmbeddingGenerator.hpp"
#include "index/IndexBuilder.hpp"
#include "store/ProfileStore.hpp"

namespace pipeline {

struct BackfillOptions {
    store::BackfillMode mode = store::BackfillMode::Full;
    std::string model = "text-embedding-3-large";
    int batch_size = 32;
};

struct BackfillSummary {
    store::BackfillMode mode = store::BackfillMode::Full;
    size_t selected_count = 0;
    size_t processed_count = 0;
    std::optional<std::string> artifact_path;   // empty when nothing was selected
    std::vector<int64_t> updated_ids;
};

// "full" | "missing", case and surrounding whitespace ignored.
// Throws core::ConfigurationError for anything else.
store::BackfillMode parse_backfill_mode(const std::string& s);
std::string to_string(store::BackfillMode mode);

// select -> flatten -> embed -> build one shared artifact -> attach.
// All or nothing: the artifact reference is attached only after the artifact
// is on disk, and any earlier failure leaves the store untouched.
BackfillSummary backfill(store::ProfileStore& store,
                         emb::EmbeddingGenerator& generator,
                         const knn::IndexBuilder& builder,
                         const BackfillOptions& opts);

using ProviderFactory = std::function<std::unique_ptr<emb::EmbeddingProvider>()>;

// Same, but the provider is only created once rows have been selected, so a
// run with nothing to do needs no credentials. A null provider is a
// core::ConfigurationError.
BackfillSummary backfill(store::ProfileStore& store,
                         const ProviderFactory& make_provider,
                         const knn::IndexBuilder& builder,
                         const BackfillOptions& opts);

} // namespace pipeline
