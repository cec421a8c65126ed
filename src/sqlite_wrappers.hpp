#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"

struct sqlite3;
struct sqlite3_stmt;

void sqlite_check(int rc, sqlite3* db);

class SqliteDatabase {
public:
    explicit SqliteDatabase(std::string const& path);

    SqliteDatabase(SqliteDatabase const& other) = delete;
    SqliteDatabase(SqliteDatabase&& other) noexcept;

    SqliteDatabase& operator=(SqliteDatabase const& other) = delete;
    SqliteDatabase& operator=(SqliteDatabase&& other) noexcept;

    ~SqliteDatabase();

    sqlite3* get();

    // Runs one or more statements that do not produce rows.
    void execute(char const* sql);

    std::int64_t last_insert_id() const;
    int changes() const;

private:
    sqlite3* m_db = nullptr;
};

class SqliteStatement {
public:
    SqliteStatement(SqliteDatabase& db, char const* sql);

    SqliteStatement(SqliteStatement const& other) = delete;
    SqliteStatement& operator=(SqliteStatement const& other) = delete;

    ~SqliteStatement();

    // Parameters are 1-based, as in the SQLite API.
    void bind(int index, std::string_view value);
    void bind(int index, double value);
    void bind(int index, std::int64_t value);

    // Returns true while rows are available and false once the statement is done.
    bool step();

    std::string column_text(int index) const;
    double column_double(int index) const;
    std::int64_t column_int(int index) const;

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

// Scoped `BEGIN IMMEDIATE` transaction that rolls back unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDatabase& db);

    SqliteTransaction(SqliteTransaction const& other) = delete;
    SqliteTransaction& operator=(SqliteTransaction const& other) = delete;

    ~SqliteTransaction();

    void commit();

private:
    SqliteDatabase& m_db;
    bool m_done = false;
};
