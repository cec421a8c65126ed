#pragma once

#include <folly/dynamic.h>

#include <cstdint>
#include <optional>
#include <string>

struct PolicyRecord {
    // Assigned by the store on insertion.
    std::optional<std::int64_t> id;

    std::string name;
    std::string snapshot_path;
    std::string architecture_tag;

    double mu = 0.0;
    double sigma = 0.0;
    std::int64_t episodes = 0;

    // Free-form key/value document. Always carries "tenured" and, for records added by a pool,
    // "anchor".
    folly::dynamic metadata = folly::dynamic::object;

    bool tenured() const;
    void set_tenured(bool tenured);

    bool anchor() const;
};

// Boolean coercion used for the tenured filter: missing/null is false, numbers are compared to zero
// and strings follow folly::to<bool>. Values that cannot be coerced count as false.
bool coerce_to_bool(folly::dynamic const* value);
