#pragma once

#include <optional>
#include <string>
#include <vector>

#include "policy_record.hpp"
#include "sqlite_wrappers.hpp"

class PolicyStore {
public:
    // Inserts `record`. If a record with the same name exists, it is replaced when `overwrite` is
    // set and NamingConflict is thrown otherwise. Returns the record with its assigned id.
    virtual PolicyRecord add(PolicyRecord record, bool overwrite) = 0;

    virtual std::optional<PolicyRecord> get_by_name(std::string const& name) = 0;

    virtual std::vector<PolicyRecord> get_all() = 0;
    std::vector<PolicyRecord> get_tenured();
    std::vector<PolicyRecord> get_untenured();

    virtual void remove(std::string const& name) = 0;

    // Commits mu, sigma, episodes and metadata of an existing record. Throws NotFound if the record
    // no longer exists.
    virtual void update(PolicyRecord const& record) = 0;

    // Same as update, but all or nothing.
    virtual void update_all(std::vector<PolicyRecord> const& records) = 0;

    PolicyStore() = default;

    PolicyStore(PolicyStore const& other) = delete;
    PolicyStore& operator=(PolicyStore const& other) = delete;

    virtual ~PolicyStore() = default;
};

// Single-writer store backed by an SQLite file in WAL mode.
class SqlitePolicyStore : public PolicyStore {
public:
    explicit SqlitePolicyStore(std::string const& path = "policy_pool.db");

    PolicyRecord add(PolicyRecord record, bool overwrite) override;
    std::optional<PolicyRecord> get_by_name(std::string const& name) override;
    std::vector<PolicyRecord> get_all() override;
    void remove(std::string const& name) override;
    void update(PolicyRecord const& record) override;
    void update_all(std::vector<PolicyRecord> const& records) override;

private:
    SqliteDatabase m_db;

    void update_row(PolicyRecord const& record);
};
