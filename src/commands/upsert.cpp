#include "commands/upsert.hpp"
#include "io/JsonIO.hpp"
#include "store/ProfileStore.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_upsert(int argc, char** argv) {
    const std::string profile_path = get_arg(argc, argv, "--profile", "");
    const std::string db_path      = get_arg(argc, argv, "--db", "outputs/resume_profiles.db");
    const std::string provenance   = get_arg(argc, argv, "--provenance", "unknown");
    const std::string source       = get_arg(argc, argv, "--source", "");

    if (profile_path.empty()) {
        std::cerr << "error: missing --profile\n";
        return 1;
    }
    const std::string external_id = get_arg(argc, argv, "--id", fs::path(profile_path).stem().string());

    try {
        const profile::ResumeProfile p = loadResumeProfile(profile_path);
        store::ProfileStore st = store::ProfileStore::create(db_path);
        st.upsert(external_id, p, provenance, source);

        std::cout << "UPSERT: " << external_id << " (rows=" << st.count() << ")\n";
        std::cout << "DB: " << st.path() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] upsert failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
