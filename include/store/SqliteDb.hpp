#pragma once
#include <cstdint>
#include <string>

#include <sqlite3.h>

namespace store {

// RAII prepared statement. Errors throw core::StoreError.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bind_null(int index);

    // true while a row is available
    bool step();
    // for statements that return no rows
    void execute();
    void reset();

    int64_t get_int64(int column) const;
    std::string get_string(int column) const;
    bool is_null(int column) const;

private:
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_stmt = nullptr;
};

enum class OpenMode {
    ReadOnly,
    ReadWrite,   // fails if the file does not exist
    Create,
};

class Database {
public:
    Database(const std::string& path, OpenMode mode);
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Statement prepare(const std::string& sql);
    void execute(const std::string& sql);

    int changes() const;
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    sqlite3* m_db = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() ran.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& m_db;
    bool m_done = false;
};

} // namespace store
