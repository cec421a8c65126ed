#include "pool_report.hpp"

#include <algorithm>
#include <format>
#include <sstream>
#include <string_view>

std::vector<RankedPolicy> rank_policies(std::vector<PolicyRecord> const& records,
                                        RatingEngine const& engine) {
    std::vector<RankedPolicy> result;

    for (PolicyRecord const& record : records) {
        RankedPolicy ranked{record.name, record.mu, record.sigma, record.episodes,
                            record.tenured()};

        if (auto it = engine.ratings().find(record.name); it != engine.ratings().end()) {
            ranked.mu = it->second.mu;
            ranked.sigma = it->second.sigma;
        }

        result.push_back(std::move(ranked));
    }

    std::ranges::stable_sort(result, [](RankedPolicy const& lhs, RankedPolicy const& rhs) {
        return lhs.mu > rhs.mu;
    });

    return result;
}

std::string format_ranking(std::vector<PolicyRecord> const& records, RatingEngine const& engine) {
    auto ranked = rank_policies(records, engine);

    std::size_t name_width = std::string_view{"Policy"}.size();
    for (RankedPolicy const& policy : ranked) {
        name_width = std::max(name_width, policy.name.size());
    }

    std::stringstream result;
    result << std::format("{:<{}}  {:>10}  {:>8}  {:>8}  {}\n", "Policy", name_width, "Mu",
                          "Sigma", "Episodes", "Tenured");

    for (RankedPolicy const& policy : ranked) {
        result << std::format("{:<{}}  {:>10.2f}  {:>8.2f}  {:>8}  {}\n", policy.name, name_width,
                              policy.mu, policy.sigma, policy.episodes,
                              policy.tenured ? "yes" : "no");
    }

    return result.str();
}
