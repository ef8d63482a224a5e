#include "store/ProfileStore.hpp"
#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "util/TextUtil.hpp"
#include "util/TimeUtil.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace store {

static const char* kRowColumns =
    "id, external_id, source_path, display_name, profile_json, provenance_tag, "
    "index_artifact, created_at, updated_at";

static ProfileRow read_row(const Statement& st) {
    ProfileRow r;
    r.id             = st.get_int64(0);
    r.external_id    = st.get_string(1);
    r.source_path    = st.get_string(2);
    r.display_name   = st.get_string(3);
    r.profile_json   = st.get_string(4);
    r.provenance_tag = st.get_string(5);
    if (!st.is_null(6)) r.index_artifact = st.get_string(6);
    r.created_at     = st.get_string(7);
    r.updated_at     = st.get_string(8);
    return r;
}

ProfileStore::ProfileStore(Database db, bool writable) : m_db(std::move(db)) {
    if (writable) ensure_schema();
}

ProfileStore ProfileStore::open(const fs::path& path) {
    if (!fs::exists(path)) {
        throw core::NotFoundError("SQLite database not found: " + path.string());
    }
    return ProfileStore(Database(path.string(), OpenMode::ReadWrite), true);
}

ProfileStore ProfileStore::create(const fs::path& path) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    return ProfileStore(Database(path.string(), OpenMode::Create), true);
}

ProfileStore ProfileStore::open_read_only(const fs::path& path) {
    if (!fs::exists(path)) {
        throw core::NotFoundError("SQLite database not found: " + path.string());
    }
    return ProfileStore(Database(path.string(), OpenMode::ReadOnly), false);
}

// empty if the table does not exist
std::unordered_set<std::string> ProfileStore::columns() {
    std::unordered_set<std::string> cols;
    Statement st = m_db.prepare("PRAGMA table_info(resume_profiles)");
    while (st.step()) cols.insert(st.get_string(1));
    return cols;
}

void ProfileStore::ensure_schema() {
    m_db.execute(R"(
        CREATE TABLE IF NOT EXISTS resume_profiles (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            external_id TEXT NOT NULL UNIQUE,
            display_name TEXT,
            profile_json TEXT NOT NULL,
            provenance_tag TEXT NOT NULL,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
    )");

    const std::unordered_set<std::string> cols = columns();

    // additive evolution: nullable columns only, existing rows untouched
    if (!cols.count("source_path")) {
        m_db.execute("ALTER TABLE resume_profiles ADD COLUMN source_path TEXT");
    }
    if (!cols.count("index_artifact")) {
        m_db.execute("ALTER TABLE resume_profiles ADD COLUMN index_artifact TEXT");
    }
}

void ProfileStore::upsert(const std::string& external_id,
                          const profile::ResumeProfile& profile,
                          const std::string& provenance_tag,
                          const std::string& source_path) {
    const std::string ext = textutil::trim(external_id);
    if (ext.empty()) throw core::ValidationError("external id must be a non-empty string");
    if (textutil::trim(provenance_tag).empty()) {
        throw core::ValidationError("provenance tag must be a non-empty string (external_id=" + ext + ")");
    }

    const std::string now = timeutil::utc_now_iso();
    const std::string name = textutil::trim(profile.personal_information.full_name);

    Transaction tx(m_db);
    Statement st = m_db.prepare(R"(
        INSERT INTO resume_profiles (
            external_id, source_path, display_name, profile_json,
            provenance_tag, created_at, updated_at
        )
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(external_id) DO UPDATE SET
            source_path = excluded.source_path,
            display_name = excluded.display_name,
            profile_json = excluded.profile_json,
            provenance_tag = excluded.provenance_tag,
            updated_at = excluded.updated_at
    )");
    st.bind(1, ext);
    if (source_path.empty()) st.bind_null(2);
    else st.bind(2, source_path);
    if (name.empty()) st.bind_null(3);
    else st.bind(3, name);
    st.bind(4, dumpResumeProfile(profile));
    st.bind(5, provenance_tag);
    st.bind(6, now);
    st.bind(7, now);
    st.execute();
    tx.commit();
}

std::vector<ProfileRow> ProfileStore::select_for_backfill(BackfillMode mode) {
    std::string sql = std::string("SELECT ") + kRowColumns + " FROM resume_profiles ";
    if (mode == BackfillMode::Missing) sql += "WHERE index_artifact IS NULL ";
    sql += "ORDER BY id ASC";

    std::vector<ProfileRow> rows;
    Statement st = m_db.prepare(sql);
    while (st.step()) rows.push_back(read_row(st));
    return rows;
}

size_t ProfileStore::attach_index_artifact(const std::vector<int64_t>& ids, const std::string& artifact_ref) {
    if (ids.empty()) return 0;

    const std::string now = timeutil::utc_now_iso();
    size_t updated = 0;

    Transaction tx(m_db);
    Statement st = m_db.prepare(
        "UPDATE resume_profiles SET index_artifact = ?, updated_at = ? WHERE id = ?");
    for (int64_t id : ids) {
        st.bind(1, artifact_ref);
        st.bind(2, now);
        st.bind(3, id);
        st.execute();
        updated += (size_t)m_db.changes();
        st.reset();
    }
    tx.commit();
    return updated;
}

std::vector<IndexedProfile> ProfileStore::lookup_by_artifact(const std::string& artifact_ref) {
    std::vector<IndexedProfile> out;
    if (!columns().count("index_artifact")) return out;

    Statement st = m_db.prepare(R"(
        SELECT id, external_id, display_name
        FROM resume_profiles
        WHERE index_artifact = ?
        ORDER BY id ASC
    )");
    st.bind(1, artifact_ref);
    while (st.step()) {
        IndexedProfile p;
        p.id = st.get_int64(0);
        p.external_id = st.get_string(1);
        p.display_name = st.get_string(2);
        out.push_back(std::move(p));
    }
    return out;
}

std::optional<ProfileRow> ProfileStore::find_by_external_id(const std::string& external_id) {
    Statement st = m_db.prepare(std::string("SELECT ") + kRowColumns +
                                " FROM resume_profiles WHERE external_id = ?");
    st.bind(1, textutil::trim(external_id));
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

size_t ProfileStore::count() {
    Statement st = m_db.prepare("SELECT COUNT(*) FROM resume_profiles");
    if (!st.step()) return 0;
    return (size_t)st.get_int64(0);
}

} // namespace store
