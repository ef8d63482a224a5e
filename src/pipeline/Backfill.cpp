#include "pipeline/Backfill.hpp"
#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "profile/Flattener.hpp"
#include "util/TextUtil.hpp"

namespace pipeline {

store::BackfillMode parse_backfill_mode(const std::string& s) {
    const std::string m = textutil::to_lower(textutil::trim(s));
    if (m == "full") return store::BackfillMode::Full;
    if (m == "missing") return store::BackfillMode::Missing;
    throw core::ConfigurationError("mode must be either 'full' or 'missing' (got '" + s + "')");
}

std::string to_string(store::BackfillMode mode) {
    return mode == store::BackfillMode::Missing ? "missing" : "full";
}

static std::string row_label(const store::ProfileRow& row) {
    return "row " + std::to_string(row.id) + " (external_id=" + row.external_id + ")";
}

static void check_batch_size(int batch_size) {
    if (batch_size <= 0) {
        throw core::ConfigurationError("batch_size must be greater than 0 (got " + std::to_string(batch_size) + ")");
    }
}

// rows must be non-empty and in the order select_for_backfill() returned them
static void index_rows(store::ProfileStore& store,
                       const std::vector<store::ProfileRow>& rows,
                       emb::EmbeddingGenerator& generator,
                       const knn::IndexBuilder& builder,
                       const BackfillOptions& opts,
                       BackfillSummary& summary) {
    std::vector<std::string> texts;
    std::vector<int64_t> ids;
    texts.reserve(rows.size());
    ids.reserve(rows.size());

    for (const auto& row : rows) {
        const profile::ResumeProfile p = parseResumeProfile(row.profile_json, row_label(row) + " profile_json");
        std::string text = profile::flatten_profile(p);
        if (textutil::trim(text).empty()) {
            throw core::ValidationError(row_label(row) + " produced empty flattened resume text");
        }
        texts.push_back(std::move(text));
        ids.push_back(row.id);
    }

    const auto vectors = generator.embed(texts, opts.model, opts.batch_size);
    const std::string artifact = knn::artifact_ref(builder.build(vectors));

    summary.processed_count = store.attach_index_artifact(ids, artifact);
    summary.artifact_path = artifact;
    summary.updated_ids = std::move(ids);
}

BackfillSummary backfill(store::ProfileStore& store,
                         emb::EmbeddingGenerator& generator,
                         const knn::IndexBuilder& builder,
                         const BackfillOptions& opts) {
    check_batch_size(opts.batch_size);

    BackfillSummary summary;
    summary.mode = opts.mode;

    const std::vector<store::ProfileRow> rows = store.select_for_backfill(opts.mode);
    summary.selected_count = rows.size();
    if (rows.empty()) return summary;

    index_rows(store, rows, generator, builder, opts, summary);
    return summary;
}

BackfillSummary backfill(store::ProfileStore& store,
                         const ProviderFactory& make_provider,
                         const knn::IndexBuilder& builder,
                         const BackfillOptions& opts) {
    check_batch_size(opts.batch_size);

    BackfillSummary summary;
    summary.mode = opts.mode;

    const std::vector<store::ProfileRow> rows = store.select_for_backfill(opts.mode);
    summary.selected_count = rows.size();
    if (rows.empty()) return summary;

    std::unique_ptr<emb::EmbeddingProvider> provider = make_provider ? make_provider() : nullptr;
    if (!provider) throw core::ConfigurationError("no embedding provider available");

    emb::EmbeddingGenerator generator(*provider);
    index_rows(store, rows, generator, builder, opts, summary);
    return summary;
}

} // namespace pipeline
