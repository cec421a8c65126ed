#include "policy_store.hpp"

#include <folly/json.h>
#include <folly/logging/xlog.h>

#include <format>

namespace {

constexpr char const* kSchema = R"(
CREATE TABLE IF NOT EXISTS policies (
    id INTEGER PRIMARY KEY,
    name TEXT UNIQUE NOT NULL,
    snapshot_path TEXT,
    architecture_tag TEXT,
    mu REAL,
    sigma REAL,
    episodes INTEGER,
    metadata TEXT
);)";

constexpr char const* kSelectColumns =
    "SELECT id, name, snapshot_path, architecture_tag, mu, sigma, episodes, metadata FROM policies";

PolicyRecord read_record(SqliteStatement const& stmt) {
    PolicyRecord record;
    record.id = stmt.column_int(0);
    record.name = stmt.column_text(1);
    record.snapshot_path = stmt.column_text(2);
    record.architecture_tag = stmt.column_text(3);
    record.mu = stmt.column_double(4);
    record.sigma = stmt.column_double(5);
    record.episodes = stmt.column_int(6);

    std::string metadata = stmt.column_text(7);
    if (!metadata.empty()) {
        try {
            record.metadata = folly::parseJson(metadata);
        } catch (std::exception const& e) {
            throw StorageFailure(
                std::format("Corrupted metadata for policy {}: {}", record.name, e.what()));
        }
    }

    return record;
}

}  // namespace

std::vector<PolicyRecord> PolicyStore::get_tenured() {
    auto all = get_all();
    std::erase_if(all, [](PolicyRecord const& record) { return !record.tenured(); });
    return all;
}

std::vector<PolicyRecord> PolicyStore::get_untenured() {
    auto all = get_all();
    std::erase_if(all, [](PolicyRecord const& record) { return record.tenured(); });
    return all;
}

SqlitePolicyStore::SqlitePolicyStore(std::string const& path) : m_db{path} {
    // In-memory databases keep the "memory" journal mode.
    m_db.execute("PRAGMA journal_mode=WAL;");
    m_db.execute(kSchema);
    XLOGF(DBG, "Opened policy store at {}", path);
}

PolicyRecord SqlitePolicyStore::add(PolicyRecord record, bool overwrite) {
    SqliteTransaction transaction{m_db};

    {
        SqliteStatement exists{m_db, "SELECT 1 FROM policies WHERE name = ?;"};
        exists.bind(1, record.name);

        if (exists.step()) {
            if (!overwrite) {
                throw NamingConflict(
                    std::format("A policy with the name '{}' already exists.", record.name));
            }

            SqliteStatement remove{m_db, "DELETE FROM policies WHERE name = ?;"};
            remove.bind(1, record.name);
            remove.step();
        }
    }

    SqliteStatement insert{m_db,
                           "INSERT INTO policies (name, snapshot_path, architecture_tag, mu, "
                           "sigma, episodes, metadata) VALUES (?, ?, ?, ?, ?, ?, ?);"};
    insert.bind(1, record.name);
    insert.bind(2, record.snapshot_path);
    insert.bind(3, record.architecture_tag);
    insert.bind(4, record.mu);
    insert.bind(5, record.sigma);
    insert.bind(6, record.episodes);
    insert.bind(7, folly::toJson(record.metadata));
    insert.step();

    record.id = m_db.last_insert_id();
    transaction.commit();

    return record;
}

std::optional<PolicyRecord> SqlitePolicyStore::get_by_name(std::string const& name) {
    SqliteStatement query{m_db, std::format("{} WHERE name = ?;", kSelectColumns).c_str()};
    query.bind(1, name);

    if (!query.step()) {
        return {};
    }

    return read_record(query);
}

std::vector<PolicyRecord> SqlitePolicyStore::get_all() {
    SqliteStatement query{m_db, std::format("{} ORDER BY id;", kSelectColumns).c_str()};
    std::vector<PolicyRecord> result;

    while (query.step()) {
        result.push_back(read_record(query));
    }

    return result;
}

void SqlitePolicyStore::remove(std::string const& name) {
    SqliteStatement stmt{m_db, "DELETE FROM policies WHERE name = ?;"};
    stmt.bind(1, name);
    stmt.step();

    if (m_db.changes() == 0) {
        throw NotFound(std::format("Policy with name '{}' does not exist.", name));
    }
}

void SqlitePolicyStore::update(PolicyRecord const& record) {
    update_row(record);
}

void SqlitePolicyStore::update_all(std::vector<PolicyRecord> const& records) {
    SqliteTransaction transaction{m_db};

    for (PolicyRecord const& record : records) {
        update_row(record);
    }

    transaction.commit();
}

void SqlitePolicyStore::update_row(PolicyRecord const& record) {
    SqliteStatement stmt{
        m_db, "UPDATE policies SET mu = ?, sigma = ?, episodes = ?, metadata = ? WHERE name = ?;"};
    stmt.bind(1, record.mu);
    stmt.bind(2, record.sigma);
    stmt.bind(3, record.episodes);
    stmt.bind(4, folly::toJson(record.metadata));
    stmt.bind(5, record.name);
    stmt.step();

    if (m_db.changes() == 0) {
        throw NotFound(std::format("Policy with name '{}' does not exist.", record.name));
    }
}
