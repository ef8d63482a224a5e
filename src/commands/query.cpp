#include "commands/query.hpp"
#include "commands/providers.hpp"
#include "core/Errors.hpp"
#include "emb/EmbeddingGenerator.hpp"
#include "io/JsonIO.hpp"
#include "pipeline/QueryResolver.hpp"
#include "profile/Flattener.hpp"
#include "util/TextUtil.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static std::string fmt_distance(float d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", (double)d);
    return buf;
}

int cmd_query(int argc, char** argv) {
    const std::string index_path   = get_arg(argc, argv, "--index", "");
    const std::string vector_path  = get_arg(argc, argv, "--vector", "");
    const std::string profile_path = get_arg(argc, argv, "--profile", "");
    const std::string provider     = get_arg(argc, argv, "--provider", "openai");
    const std::string model        = get_arg(argc, argv, "--model", "text-embedding-3-large");
    const std::string vocab        = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");

    if (index_path.empty()) {
        std::cerr << "error: missing --index\n";
        return 1;
    }
    if (vector_path.empty() == profile_path.empty()) {
        std::cerr << "error: need exactly one of --vector <json> or --profile <json>\n";
        return 1;
    }

    std::optional<fs::path> db_path;
    if (has_flag(argc, argv, "--db")) db_path = fs::path(get_arg(argc, argv, "--db", ""));

    try {
        const int top_k = std::stoi(get_arg(argc, argv, "--topk", "5"));
        const size_t max_len = (size_t)std::stoul(get_arg(argc, argv, "--max_len", "256"));

        std::vector<float> query;
        if (!vector_path.empty()) {
            query = loadVector(vector_path);
        } else {
            const std::string text = profile::flatten_profile(loadResumeProfile(profile_path));
            if (textutil::trim(text).empty()) throw core::ValidationError("flattened resume profile is empty");

            std::cout << "Flattened resume profile:\n" << text << "\n\n";

            auto prov = make_provider(provider, model, vocab, max_len);
            if (!prov) return 1;
            emb::EmbeddingGenerator gen(*prov);
            query = gen.embed({text}, model, 1).at(0);
        }

        const auto neighbors = pipeline::resolve_query(query, index_path, db_path, top_k);

        std::cout << "Top " << neighbors.size() << " nearest neighbors:\n";
        for (const auto& n : neighbors) {
            std::cout << "[" << n.rank << "] distance=" << fmt_distance(n.distance)
                      << " position=" << n.position;
            if (n.profile) {
                std::cout << " id=" << n.profile->id
                          << " external_id=" << n.profile->external_id
                          << " name=" << n.profile->display_name;
            }
            std::cout << "\n";
        }

        std::cout << "\n";
        std::cout << "Index: " << index_path << "\n";
        std::cout << "Mapping DB: " << (db_path ? db_path->string() : std::string("(none)")) << "\n";
        std::cout << "Requested top_k: " << top_k << "\n";
        std::cout << "Returned neighbors: " << neighbors.size() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "[error] bad numeric argument: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] query failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
