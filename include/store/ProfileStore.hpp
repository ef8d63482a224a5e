#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "profile/Models.hpp"
#include "store/SqliteDb.hpp"

namespace store {

enum class BackfillMode {
    Full,     // every row
    Missing,  // rows with no index artifact yet
};

struct ProfileRow {
    int64_t id = 0;                 // internal, monotonic
    std::string external_id;        // stable, unique
    std::string source_path;        // "" if unknown
    std::string display_name;       // "" if the profile has no name
    std::string profile_json;
    std::string provenance_tag;
    std::optional<std::string> index_artifact;
    std::string created_at;
    std::string updated_at;
};

struct IndexedProfile {
    int64_t id = 0;
    std::string external_id;
    std::string display_name;
};

// SQLite-backed table of extracted profiles.
//
// Positions inside an index artifact are resolved to rows purely by order, so
// select_for_backfill() and lookup_by_artifact() both sort by ascending id and
// must keep doing so.
class ProfileStore {
public:
    // Existing store only. Throws core::NotFoundError if the file is missing.
    static ProfileStore open(const std::filesystem::path& path);
    // Creates parent directories and the database file when needed.
    static ProfileStore create(const std::filesystem::path& path);
    // Query-side open: SQLITE_OPEN_READONLY, no schema changes. A file without
    // the profile table simply maps nothing. Throws core::NotFoundError if missing.
    static ProfileStore open_read_only(const std::filesystem::path& path);

    // Insert, or overwrite payload/provenance in place. Keeps created_at and the
    // artifact reference.
    void upsert(const std::string& external_id,
                const profile::ResumeProfile& profile,
                const std::string& provenance_tag,
                const std::string& source_path = "");

    std::vector<ProfileRow> select_for_backfill(BackfillMode mode);

    // Sets index_artifact for exactly these ids in one transaction.
    // Returns rows changed; 0 for an empty list.
    size_t attach_index_artifact(const std::vector<int64_t>& ids, const std::string& artifact_ref);

    // Empty when the file has no profile table or no artifact column.
    std::vector<IndexedProfile> lookup_by_artifact(const std::string& artifact_ref);

    std::optional<ProfileRow> find_by_external_id(const std::string& external_id);

    size_t count();

    const std::string& path() const { return m_db.path(); }

private:
    ProfileStore(Database db, bool writable);

    void ensure_schema();
    std::unordered_set<std::string> columns();

    Database m_db;
};

} // namespace store
