#include "sqlite_wrappers.hpp"

#include <folly/logging/xlog.h>
#include <sqlite3.h>

#include <format>
#include <utility>

void sqlite_check(int rc, sqlite3* db) {
    if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw StorageFailure(db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    }
}

SqliteDatabase::SqliteDatabase(std::string const& path) {
    int rc = sqlite3_open_v2(path.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = std::format("Failed to open database {}: {}", path,
                                          m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageFailure(message);
    }
}

SqliteDatabase::SqliteDatabase(SqliteDatabase&& other) noexcept
    : m_db{std::exchange(other.m_db, nullptr)} {}

SqliteDatabase& SqliteDatabase::operator=(SqliteDatabase&& other) noexcept {
    if (m_db) {
        sqlite3_close(m_db);
    }

    m_db = std::exchange(other.m_db, nullptr);
    return *this;
}

SqliteDatabase::~SqliteDatabase() {
    if (m_db && sqlite3_close(m_db) != SQLITE_OK) {
        XLOG(WARN, "Database closed with unfinalized statements.");
    }
}

sqlite3* SqliteDatabase::get() {
    return m_db;
}

void SqliteDatabase::execute(char const* sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &error);

    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw StorageFailure(message);
    }
}

std::int64_t SqliteDatabase::last_insert_id() const {
    return sqlite3_last_insert_rowid(m_db);
}

int SqliteDatabase::changes() const {
    return sqlite3_changes(m_db);
}

SqliteStatement::SqliteStatement(SqliteDatabase& db, char const* sql) : m_db{db.get()} {
    sqlite_check(sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr), m_db);
}

SqliteStatement::~SqliteStatement() {
    sqlite3_finalize(m_stmt);
}

void SqliteStatement::bind(int index, std::string_view value) {
    sqlite_check(sqlite3_bind_text(m_stmt, index, value.data(), int(value.size()),
                                   SQLITE_TRANSIENT),
                 m_db);
}

void SqliteStatement::bind(int index, double value) {
    sqlite_check(sqlite3_bind_double(m_stmt, index, value), m_db);
}

void SqliteStatement::bind(int index, std::int64_t value) {
    sqlite_check(sqlite3_bind_int64(m_stmt, index, value), m_db);
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(m_stmt);
    sqlite_check(rc, m_db);
    return rc == SQLITE_ROW;
}

std::string SqliteStatement::column_text(int index) const {
    auto const* text = reinterpret_cast<char const*>(sqlite3_column_text(m_stmt, index));
    return text ? std::string{text} : std::string{};
}

double SqliteStatement::column_double(int index) const {
    return sqlite3_column_double(m_stmt, index);
}

std::int64_t SqliteStatement::column_int(int index) const {
    return sqlite3_column_int64(m_stmt, index);
}

SqliteTransaction::SqliteTransaction(SqliteDatabase& db) : m_db{db} {
    m_db.execute("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!m_done) {
        // Nothing sensible to do if the rollback itself fails, the connection is unusable anyway.
        if (sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            XLOG(ERR, "Failed to roll back transaction.");
        }
    }
}

void SqliteTransaction::commit() {
    m_db.execute("COMMIT;");
    m_done = true;
}
