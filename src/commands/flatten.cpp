#include "commands/flatten.hpp"
#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "profile/Flattener.hpp"
#include "store/ProfileStore.hpp"
#include "util/TextUtil.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_flatten(int argc, char** argv) {
    const std::string external_id  = textutil::trim(get_arg(argc, argv, "--id", ""));
    const std::string profile_path = get_arg(argc, argv, "--profile", "");
    const std::string db_path      = get_arg(argc, argv, "--db", "outputs/resume_profiles.db");

    if (external_id.empty() && profile_path.empty()) {
        std::cerr << "error: need --id <external_id> or --profile <json>\n";
        return 1;
    }

    try {
        profile::ResumeProfile p;
        if (!profile_path.empty()) {
            p = loadResumeProfile(profile_path);
        } else {
            store::ProfileStore st = store::ProfileStore::open(db_path);
            auto row = st.find_by_external_id(external_id);
            if (!row) throw core::NotFoundError("no resume_profiles row for external_id: " + external_id);

            std::cout << "DB: " << st.path() << "\n";
            std::cout << "Row id: " << row->id << "\n";
            std::cout << "External id: " << row->external_id << "\n";
            p = parseResumeProfile(row->profile_json, "row " + std::to_string(row->id) + " profile_json");
        }

        const std::string text = profile::flatten_profile(p);
        if (textutil::trim(text).empty()) throw core::ValidationError("flattened resume profile is empty");

        std::cout << "Flattened resume profile:\n" << text << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
