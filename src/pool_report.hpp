#pragma once

#include <string>
#include <vector>

#include "policy_record.hpp"
#include "rating.hpp"

struct RankedPolicy {
    std::string name;
    double mu;
    double sigma;
    std::int64_t episodes;
    bool tenured;
};

// Stored policies ordered by skill, best first. Ratings known to `engine` take precedence over the
// values in the records.
std::vector<RankedPolicy> rank_policies(std::vector<PolicyRecord> const& records,
                                        RatingEngine const& engine);

// Plain text table of `rank_policies`, one policy per line.
std::string format_ranking(std::vector<PolicyRecord> const& records, RatingEngine const& engine);
