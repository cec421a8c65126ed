#include "rating.hpp"

#include <folly/logging/xlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

constexpr double kKappa = 1e-4;

// Anchors are pinned, a tiny sigma keeps them from absorbing the updates of their opponents.
constexpr double kAnchorSigma = 1e-3;

}  // namespace

std::map<std::string, Rating>& RatingEngine::ratings() {
    return m_ratings;
}

std::map<std::string, Rating> const& RatingEngine::ratings() const {
    return m_ratings;
}

std::optional<std::string> const& RatingEngine::anchor() const {
    return m_anchor;
}

void RatingEngine::clear_anchor() {
    m_anchor.reset();
}

OpenSkillRating::OpenSkillRating(double mu, double anchor_mu, double sigma)
    : m_mu{mu}, m_anchor_mu{anchor_mu}, m_sigma{sigma}, m_beta{sigma / 2} {}

void OpenSkillRating::add_policy(std::string const& name) {
    m_ratings.try_emplace(name, Rating{m_mu, m_sigma});
}

void OpenSkillRating::set_anchor(std::string const& name) {
    if (m_anchor && *m_anchor != name) {
        XLOGF(WARN, "Replacing rating anchor {} with {}", *m_anchor, name);
    }

    m_anchor = name;
    m_ratings.insert_or_assign(name, Rating{m_anchor_mu, kAnchorSigma});
}

void OpenSkillRating::update(std::vector<std::string> const& names,
                             std::vector<std::vector<double>> const& samples) {
    if (names.size() != samples.size()) {
        throw std::invalid_argument("Rating update needs one sample list per name.");
    }

    struct Competitor {
        std::string const* name;
        double score;
        Rating rating;
        int rank = 0;
    };

    std::vector<Competitor> competitors;

    for (std::size_t i = 0; i < names.size(); ++i) {
        if (samples[i].empty()) {
            continue;
        }

        add_policy(names[i]);
        double score = std::accumulate(samples[i].begin(), samples[i].end(), 0.0) /
                       double(samples[i].size());
        competitors.push_back({&names[i], score, m_ratings.at(names[i])});
    }

    if (competitors.size() < 2) {
        XLOGF(DBG, "Skipping rating update with {} competitor(s).", competitors.size());
        return;
    }

    // Higher scores are better, rank 0 is the winner and ties share a rank.
    std::vector<std::size_t> order(competitors.size());
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(order, [&](std::size_t lhs, std::size_t rhs) {
        return competitors[lhs].score > competitors[rhs].score;
    });

    for (std::size_t i = 1; i < order.size(); ++i) {
        Competitor const& previous = competitors[order[i - 1]];
        Competitor& current = competitors[order[i]];
        current.rank = current.score == previous.score ? previous.rank : int(i);
    }

    double c_squared = 0.0;
    for (Competitor const& competitor : competitors) {
        c_squared += competitor.rating.sigma * competitor.rating.sigma + m_beta * m_beta;
    }
    double const c = std::sqrt(c_squared);

    std::vector<double> sum_q(competitors.size(), 0.0);
    std::vector<int> ties(competitors.size(), 0);

    for (std::size_t q = 0; q < competitors.size(); ++q) {
        for (Competitor const& other : competitors) {
            if (other.rank >= competitors[q].rank) {
                sum_q[q] += std::exp(other.rating.mu / c);
            }
            if (other.rank == competitors[q].rank) {
                ++ties[q];
            }
        }
    }

    std::vector<Rating> updated;
    updated.reserve(competitors.size());

    for (std::size_t i = 0; i < competitors.size(); ++i) {
        Rating const& rating = competitors[i].rating;
        double const strength = std::exp(rating.mu / c);
        double omega = 0.0;
        double delta = 0.0;

        for (std::size_t q = 0; q < competitors.size(); ++q) {
            if (competitors[q].rank > competitors[i].rank) {
                continue;
            }

            double const quotient = strength / sum_q[q];
            if (q == i) {
                omega += (1 - quotient) / ties[q];
            } else {
                omega -= quotient / ties[q];
            }
            delta += quotient * (1 - quotient) / ties[q];
        }

        double const sigma_squared = rating.sigma * rating.sigma;
        double const gamma = rating.sigma / c;
        omega *= sigma_squared / c;
        delta *= gamma * sigma_squared / c_squared;

        updated.push_back({rating.mu + omega,
                           rating.sigma * std::sqrt(std::max(1 - delta, kKappa))});
    }

    for (std::size_t i = 0; i < competitors.size(); ++i) {
        if (m_anchor && *competitors[i].name == *m_anchor) {
            continue;
        }

        m_ratings[*competitors[i].name] = updated[i];
    }
}
