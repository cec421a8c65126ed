#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/init/Init.h>
#include <folly/logging/xlog.h>
#include <gflags/gflags.h>

#include <chrono>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

#include "errors.hpp"
#include "model_registry.hpp"
#include "policy_pool.hpp"
#include "policy_store.hpp"
#include "pool_report.hpp"
#include "rating.hpp"

DEFINE_string(db, "policy_pool.db", "SQLite database holding the policy records");
DEFINE_string(path, "pool", "Folder that policy snapshots are written to");
DEFINE_string(learner, "learner", "Name of the learner policy");
DEFINE_uint64(seed, 42, "Random seed");

DEFINE_string(architecture, "mlp", "Model architecture of the learner (mlp or lstm)");
DEFINE_int32(observation_size, 16, "Size of a single observation");
DEFINE_int32(action_count, 4, "Number of discrete actions");
DEFINE_int32(hidden_size, 128, "Hidden layer size");

DEFINE_int32(batch_size, 64, "Number of agents evaluated per step");
DEFINE_string(weights, "4,1,1,1", "Comma separated sample weights, one per active policy");
DEFINE_int32(agents_per_env, 2, "Number of agents per environment");

DEFINE_double(mu, 1000, "Initial skill mean");
DEFINE_double(anchor_mu, 1000, "Skill mean of the anchor policy");
DEFINE_double(sigma, 100.0 / 3, "Initial skill uncertainty");

DEFINE_int32(rounds, 100, "Number of evaluation rounds to play");
DEFINE_int32(rank_interval, 10, "Rounds between rank updates");
DEFINE_int32(snapshot_interval, 50, "Rounds between learner snapshots (0 to disable)");

DEFINE_bool(ranking, false, "Print the ranking of all stored policies and exit");
DEFINE_string(copy_from, "", "Stored policy to copy");
DEFINE_string(copy_to, "", "Name of the copy");
DEFINE_bool(tenured, false, "Mark the copy as tenured");
DEFINE_bool(anchor, false, "Register the copy as the rating anchor");

enum class Mode {
    Evaluate,
    Ranking,
    Copy
};

std::string get_usage_message() {
    std::ostringstream oss;
    oss << "Policy Pool Usage:\n\n"
        << "RANKING: Print all stored policies ordered by skill\n"
        << "    ./policy_pool --ranking --db <pool.db>\n"
        << "COPY: Add a copy of a stored policy under a new name\n"
        << "    ./policy_pool --copy_from <name> --copy_to <new name> [--tenured] [--anchor]\n"
        << "EVALUATION: Play synthetic evaluation rounds and update the ratings\n"
        << "    ./policy_pool --rounds N\n"
        << "  Options:\n"
        << "    --rank_interval N      # Rounds between rank updates (default 10)\n"
        << "    --snapshot_interval N  # Rounds between learner snapshots (default 50)\n"
        << "    --batch_size N         # Agents per step (default 64)\n"
        << "    --weights W,W,...      # Sample weights per active policy (default 4,1,1,1)\n"
        << "    --agents_per_env N     # Agents per environment (default 2)\n"
        << "COMMON OPTIONS:\n"
        << "    --db FILE              # Policy database (default policy_pool.db)\n"
        << "    --path DIR             # Snapshot folder (default pool)\n"
        << "    --learner NAME         # Learner policy name (default learner)\n"
        << "    --architecture A       # mlp or lstm (default mlp)\n"
        << "    --observation_size N --action_count N --hidden_size N\n"
        << "    --mu X --anchor_mu X --sigma X\n"
        << "    --seed N               # Random seed (default 42)\n"
        << "See --help for all options\n";
    return oss.str();
}

std::vector<int> parse_weights(std::string const& flag) {
    std::vector<int> weights;
    folly::splitTo<int>(',', flag, std::back_inserter(weights), true);
    return weights;
}

PolicyPool::Options pool_options() {
    auto weights = parse_weights(FLAGS_weights);
    int num_active_policies = int(weights.size());

    return {
        .evaluation_batch_size = FLAGS_batch_size,
        .sample_weights = std::move(weights),
        .num_active_policies = num_active_policies,
        .path = FLAGS_path,
        .mu = FLAGS_mu,
        .anchor_mu = FLAGS_anchor_mu,
        .sigma = FLAGS_sigma,
        .seed = FLAGS_seed,
    };
}

// The learner continues from its stored snapshot if there is one.
std::unique_ptr<PolicyModel> create_learner(ModelRegistry const& registry, PolicyStore& store) {
    ModelShape shape{FLAGS_observation_size, FLAGS_action_count, FLAGS_hidden_size};
    auto learner = registry.create(FLAGS_architecture, shape);

    if (auto record = store.get_by_name(FLAGS_learner)) {
        if (record->architecture_tag != FLAGS_architecture) {
            throw ConfigurationError(std::format("Stored learner {} is a {} model, not {}.",
                                                 FLAGS_learner, record->architecture_tag,
                                                 FLAGS_architecture));
        }

        XLOGF(INFO, "Resuming learner from {}", record->snapshot_path);
        learner->load(record->snapshot_path);
    }

    return learner;
}

void ranking(PolicyStore& store) {
    OpenSkillRating rating{FLAGS_mu, FLAGS_anchor_mu, FLAGS_sigma};
    std::cout << format_ranking(store.get_all(), rating);
}

// Copies go straight to the store, the learner and every other record stay untouched.
void copy(PolicyStore& store) {
    auto source = store.get_by_name(FLAGS_copy_from);
    if (!source) {
        throw NotFound(std::format("Policy with name '{}' does not exist.", FLAGS_copy_from));
    }

    ModelShape shape{FLAGS_observation_size, FLAGS_action_count, FLAGS_hidden_size};
    auto model = default_registry().create(source->architecture_tag, shape);
    model->load(source->snapshot_path);

    save_policy(store, *model, FLAGS_path, FLAGS_copy_to, FLAGS_tenured, source->mu, source->sigma,
                FLAGS_anchor, false);
    XLOGF(INFO, "Copied policy {} to {}.", FLAGS_copy_from, FLAGS_copy_to);

    ranking(store);
}

// Agents score 1 for picking the action whose observation feature is largest.
std::vector<AgentInfos> score_actions(torch::Tensor const& observations,
                                      torch::Tensor const& actions) {
    auto targets = observations.narrow(1, 0, FLAGS_action_count).argmax(1).to(torch::kCPU);
    auto chosen = actions.to(torch::kCPU);

    std::vector<AgentInfos> infos;
    for (int agent = 0; agent < FLAGS_batch_size; ++agent) {
        if (agent % FLAGS_agents_per_env == 0) {
            infos.emplace_back();
        }

        bool const hit = chosen[agent].item<std::int64_t>() == targets[agent].item<std::int64_t>();
        infos.back().push_back(folly::dynamic::object("score", hit ? 1.0 : 0.0));
    }

    return infos;
}

void evaluate(PolicyPool& pool, PolicyModel const& learner) {
    torch::manual_seed(FLAGS_seed);

    std::optional<RecurrentState> state;
    if (learner.recurrent()) {
        auto zeros = torch::zeros({1, FLAGS_batch_size, FLAGS_hidden_size});
        state = RecurrentState{zeros, zeros.clone()};
    }

    for (int round = 1; round <= FLAGS_rounds; ++round) {
        auto observations = torch::randn({FLAGS_batch_size, FLAGS_observation_size});
        auto dones = torch::zeros({FLAGS_batch_size}, torch::kBool);

        auto output = pool.forward(observations, state, dones);
        pool.update_scores(score_actions(observations, output.actions), "score");

        if (round % FLAGS_rank_interval == 0) {
            pool.update_ranks();
            pool.update_active_policies();
        }

        if (FLAGS_snapshot_interval > 0 && round % FLAGS_snapshot_interval == 0) {
            pool.add_policy_copy(FLAGS_learner, std::format("{}_{}", FLAGS_learner, round));
        }
    }

    pool.update_ranks();
    std::cout << format_ranking(pool.store().get_all(), pool.rating_engine());
}

int main(int argc, char** argv) {
    // If no arguments are provided (only program name), print usage and exit.
    if (argc == 1) {
        std::cout << get_usage_message() << std::endl;
        return 1;
    }

    gflags::SetUsageMessage(get_usage_message());
    folly::Init init(&argc, &argv, true);

    Mode mode = Mode::Evaluate;
    if (FLAGS_ranking) {
        mode = Mode::Ranking;
    } else if (!FLAGS_copy_from.empty() || !FLAGS_copy_to.empty()) {
        mode = Mode::Copy;
    }

    if (mode == Mode::Copy && (FLAGS_copy_from.empty() || FLAGS_copy_to.empty())) {
        XLOG(ERR, "Copying a policy requires both --copy_from and --copy_to.");
        return 1;
    }

    if (mode == Mode::Evaluate) {
        if (FLAGS_observation_size < FLAGS_action_count) {
            XLOG(ERR, "Evaluation needs --observation_size to be at least --action_count.");
            return 1;
        }
        if (FLAGS_agents_per_env <= 0 || FLAGS_batch_size % FLAGS_agents_per_env != 0) {
            XLOG(ERR, "--batch_size must be a multiple of --agents_per_env.");
            return 1;
        }
        if (FLAGS_rank_interval <= 0) {
            XLOG(ERR, "--rank_interval must be positive.");
            return 1;
        }
    }

    auto start = std::chrono::high_resolution_clock::now();

    try {
        auto store = std::make_shared<SqlitePolicyStore>(FLAGS_db);

        if (mode == Mode::Ranking) {
            ranking(*store);
            return 0;
        }

        if (mode == Mode::Copy) {
            copy(*store);
            return 0;
        }

        auto opts = pool_options();
        auto learner = create_learner(opts.registry, *store);
        PolicyPool pool{*learner, FLAGS_learner, store, std::move(opts)};
        evaluate(pool, *learner);
    } catch (ConfigurationError const& e) {
        XLOGF(ERR, "Invalid configuration: {}", e.what());
        return 1;
    } catch (std::exception const& e) {
        XLOGF(ERR, "{}", e.what());
        return 1;
    }

    auto stop = std::chrono::high_resolution_clock::now();
    XLOGF(INFO, "Completed in {} seconds.",
          std::chrono::duration_cast<std::chrono::seconds>(stop - start).count());
    return 0;
}
