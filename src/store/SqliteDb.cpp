#include "store/SqliteDb.hpp"
#include "core/Errors.hpp"

#include <iostream>
#include <utility>

namespace store {

static std::string errmsg(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "unknown sqlite error";
}

Statement::Statement(sqlite3* db, const std::string& sql) : m_db(db) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg(db);
        if (m_stmt) sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw core::StoreError("failed to prepare statement: " + msg + " [" + sql + "]");
    }
}

Statement::~Statement() {
    if (m_stmt) sqlite3_finalize(m_stmt);
}

Statement::Statement(Statement&& other) noexcept
    : m_db(other.m_db), m_stmt(std::exchange(other.m_stmt, nullptr)) {}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(m_stmt, index, value) != SQLITE_OK) {
        throw core::StoreError("bind failed: " + errmsg(m_db));
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(m_stmt, index, value.data(), (int)value.size(), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw core::StoreError("bind failed: " + errmsg(m_db));
    }
}

void Statement::bind_null(int index) {
    if (sqlite3_bind_null(m_stmt, index) != SQLITE_OK) {
        throw core::StoreError("bind failed: " + errmsg(m_db));
    }
}

bool Statement::step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw core::StoreError("step failed: " + errmsg(m_db));
}

void Statement::execute() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

int64_t Statement::get_int64(int column) const {
    return sqlite3_column_int64(m_stmt, column);
}

std::string Statement::get_string(int column) const {
    const unsigned char* txt = sqlite3_column_text(m_stmt, column);
    if (!txt) return "";
    int n = sqlite3_column_bytes(m_stmt, column);
    return std::string(reinterpret_cast<const char*>(txt), (size_t)n);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

Database::Database(const std::string& path, OpenMode mode) : m_path(path) {
    int flags = SQLITE_OPEN_READWRITE;
    if (mode == OpenMode::ReadOnly) flags = SQLITE_OPEN_READONLY;
    if (mode == OpenMode::Create) flags |= SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg(m_db);
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw core::StoreError("failed to open database " + path + ": " + msg);
    }

    // matches the 30s connect timeout writers historically used
    sqlite3_busy_timeout(m_db, 30000);
}

Database::~Database() {
    if (m_db) sqlite3_close(m_db);
}

Database::Database(Database&& other) noexcept
    : m_path(std::move(other.m_path)), m_db(std::exchange(other.m_db, nullptr)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (m_db) sqlite3_close(m_db);
        m_path = std::move(other.m_path);
        m_db = std::exchange(other.m_db, nullptr);
    }
    return *this;
}

Statement Database::prepare(const std::string& sql) {
    return Statement(m_db, sql);
}

void Database::execute(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : errmsg(m_db);
        sqlite3_free(err);
        throw core::StoreError(msg + " [" + sql + "]");
    }
}

int Database::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

Transaction::Transaction(Database& db) : m_db(db) {
    m_db.execute("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (m_done) return;
    try {
        m_db.execute("ROLLBACK");
    } catch (const std::exception& e) {
        std::cerr << "[warn] rollback failed: " << e.what() << "\n";
    }
}

void Transaction::commit() {
    m_db.execute("COMMIT");
    m_done = true;
}

} // namespace store
