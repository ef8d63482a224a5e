#include "commands/backfill.hpp"
#include "commands/providers.hpp"
#include "index/IndexBuilder.hpp"
#include "pipeline/Backfill.hpp"
#include "store/ProfileStore.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_backfill(int argc, char** argv) {
    const std::string db_path   = get_arg(argc, argv, "--db", "outputs/resume_profiles.db");
    const std::string index_dir = get_arg(argc, argv, "--index_dir", "outputs/indexes");
    const std::string mode      = get_arg(argc, argv, "--mode", "full");
    const std::string provider  = get_arg(argc, argv, "--provider", "openai");
    const std::string model     = get_arg(argc, argv, "--model", "text-embedding-3-large");
    const std::string vocab     = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");

    try {
        pipeline::BackfillOptions opts;
        opts.mode = pipeline::parse_backfill_mode(mode);
        opts.model = model;
        opts.batch_size = std::stoi(get_arg(argc, argv, "--batch_size", "32"));
        const size_t max_len = (size_t)std::stoul(get_arg(argc, argv, "--max_len", "256"));

        store::ProfileStore st = store::ProfileStore::open(db_path);

        knn::IndexBuilder builder(index_dir);

        const pipeline::BackfillSummary s = pipeline::backfill(
            st, [&] { return make_provider(provider, model, vocab, max_len); }, builder, opts);

        std::cout << "SQLite input: " << st.path() << "\n";
        std::cout << "Index output dir: " << builder.index_dir().string() << "\n";
        std::cout << "Backfill mode: " << pipeline::to_string(s.mode) << "\n";
        std::cout << "Rows selected: " << s.selected_count << "\n";
        std::cout << "Rows updated: " << s.processed_count << "\n";
        if (s.artifact_path) std::cout << "Shared index: " << *s.artifact_path << "\n";
        else std::cout << "No index generated (no rows selected).\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "[error] bad numeric argument: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] backfill failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
