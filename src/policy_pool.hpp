#pragma once

#include <folly/dynamic.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "model_registry.hpp"
#include "policy_model.hpp"
#include "policy_store.hpp"
#include "rating.hpp"
#include "sample_partition.hpp"

// Per-agent info objects of one environment step, in agent order.
using AgentInfos = std::vector<folly::dynamic>;

struct PoolOutput {
    torch::Tensor actions;
    torch::Tensor log_probs;
    torch::Tensor values;
    std::optional<RecurrentState> state;
};

// A policy of the current roster together with the model materialized from its snapshot.
struct ActivePolicy {
    PolicyRecord record;
    std::unique_ptr<PolicyModel> model;
};

// Writes a snapshot of `model` to `root / name` and inserts its record into `store`. An existing
// snapshot file is only replaced once the record is committed. Registering an anchor clears the
// anchor flag of every other stored record. Throws NamingConflict if the name is taken and
// `overwrite_existing` is not set.
PolicyRecord save_policy(PolicyStore& store, PolicyModel const& model, std::string const& root,
                         std::string const& name, bool tenured, double mu, double sigma,
                         bool anchor, bool overwrite_existing);

// Population of self-play opponents. Every round, the evaluation batch is split between a roster
// of active policies (slot 0 is always the learner), per-agent outcomes are collected per policy
// name and periodically turned into new skill ratings that are written back to the store.
//
// Not thread-safe: one caller drives the add -> activate -> forward -> score -> rank cycle.
class PolicyPool {
public:
    struct Options {
        int evaluation_batch_size = 0;
        std::vector<int> sample_weights;
        int num_active_policies = 4;

        // Snapshots are stored at `path / name`.
        std::string path = "pool";

        double mu = 1000;
        double anchor_mu = 1000;
        double sigma = 100.0 / 3;

        std::uint64_t seed = 42;

        ModelRegistry registry = default_registry();
    };

    PolicyPool(PolicyModel const& learner, std::string name, std::shared_ptr<PolicyStore> store,
               Options opts);
    PolicyPool(PolicyModel const& learner, std::string name, std::shared_ptr<PolicyStore> store,
               std::unique_ptr<RatingEngine> rating, Options opts);

    // Snapshots a copy of `model` under `name` and registers it with the rating engine. Throws
    // NamingConflict if the name is taken and `overwrite_existing` is not set, and
    // ConfigurationError if `model` is not of the learner's architecture.
    void add_policy(PolicyModel const& model, std::string const& name, bool tenured = false,
                    std::optional<double> mu = {}, std::optional<double> sigma = {},
                    bool anchor = false, bool overwrite_existing = true);

    // Adds a copy of a stored policy, including its current rating, under a new name. Throws
    // NotFound if `source` does not exist.
    void add_policy_copy(std::string const& source, std::string const& name, bool tenured = false,
                         bool anchor = false);

    // Rebuilds the roster: the learner in slot 0, the other slots sampled uniformly (with
    // replacement) from the store. Each slot gets a freshly allocated model of the learner's
    // architecture with its own snapshot. Throws ConfigurationError for a record of another
    // architecture, keeping the previous roster.
    void update_active_policies();

    // Splits the batch between the roster and returns the combined outputs. If `state` is given,
    // it is updated in place for every slot. Rows of slots whose model returns no state keep the
    // caller's state.
    PoolOutput forward(torch::Tensor const& observations,
                       std::optional<RecurrentState> state = {},
                       std::optional<torch::Tensor> dones = {});

    // Appends `info[metric_key]` of every agent to the ledger of the policy that controls it.
    // Agents without the key are skipped. Returns the agent infos grouped by policy name.
    std::map<std::string, std::vector<folly::dynamic>> update_scores(
        std::vector<AgentInfos> const& infos, std::string const& metric_key);

    // Rates every policy in the ledger and commits the new ratings to the store, then clears the
    // ledger. On storage failure nothing is committed and the ledger is kept.
    void update_ranks();

    std::map<std::string, Rating> const& ratings() const;
    RatingEngine const& rating_engine() const;

    std::vector<std::string> active_policies() const;
    std::vector<std::vector<std::int64_t>> const& sample_indices() const;
    torch::Tensor learner_mask() const;

    std::map<std::string, std::vector<double>> const& scores() const;
    std::int64_t num_scores() const;

    PolicyStore& store();

private:
    ModelShape m_learner_shape;
    std::string m_learner_architecture;
    std::string m_learner_name;
    std::shared_ptr<PolicyStore> m_store;
    std::unique_ptr<RatingEngine> m_rating;
    Options m_opts;

    SamplePartition m_partition;
    std::vector<ActivePolicy> m_active_policies;
    std::mt19937_64 m_twister;

    std::map<std::string, std::vector<double>> m_scores;
    std::int64_t m_num_scores = 0;

    // Output buffers, allocated from the first slot result.
    bool m_allocated = false;
    torch::Tensor m_actions;
    torch::Tensor m_log_probs;
    torch::Tensor m_values;
    torch::Tensor m_hidden;
    torch::Tensor m_cell;

    std::unique_ptr<PolicyModel> materialize(PolicyRecord const& record) const;
    void allocate_buffers(PolicyOutput const& first, std::optional<RecurrentState> const& state);
};
