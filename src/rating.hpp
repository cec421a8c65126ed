#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

struct Rating {
    double mu;
    double sigma;
};

// Skill rating tournament over named policies. Ratings are directly accessible so callers can seed
// them after registration.
class RatingEngine {
public:
    // Registers a competitor with the default rating. Does nothing if the name is known.
    virtual void add_policy(std::string const& name) = 0;

    // Registers `name` as the fixed reference point of the tournament. Updates never change its
    // rating.
    virtual void set_anchor(std::string const& name) = 0;

    // Recomputes ratings from one list of outcome samples per name. All names are rated against
    // each other in a single batched step.
    virtual void update(std::vector<std::string> const& names,
                        std::vector<std::vector<double>> const& samples) = 0;

    std::map<std::string, Rating>& ratings();
    std::map<std::string, Rating> const& ratings() const;

    std::optional<std::string> const& anchor() const;

    // Turns the anchor back into a normal competitor, keeping its current rating.
    void clear_anchor();

    RatingEngine() = default;

    RatingEngine(RatingEngine const& other) = delete;
    RatingEngine& operator=(RatingEngine const& other) = delete;

    virtual ~RatingEngine() = default;

protected:
    std::map<std::string, Rating> m_ratings;
    std::optional<std::string> m_anchor;
};

// Weng-Lin Bayesian rating with the Plackett-Luce model, the default model of OpenSkill. Every
// policy is a team of one, ranked by the mean of its samples.
class OpenSkillRating : public RatingEngine {
public:
    OpenSkillRating(double mu, double anchor_mu, double sigma);

    void add_policy(std::string const& name) override;
    void set_anchor(std::string const& name) override;
    void update(std::vector<std::string> const& names,
                std::vector<std::vector<double>> const& samples) override;

private:
    double m_mu;
    double m_anchor_mu;
    double m_sigma;
    double m_beta;
};
