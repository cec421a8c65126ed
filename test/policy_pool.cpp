#include "policy_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "test_utils.hpp"

namespace {

// Mock that never returns recurrent state.
struct StatelessModel : MockModel {
    using MockModel::MockModel;

    PolicyOutput act(torch::Tensor observations, std::optional<RecurrentState>,
                     std::optional<torch::Tensor> dones) override {
        return MockModel::act(std::move(observations), std::nullopt, std::move(dones));
    }

    std::unique_ptr<PolicyModel> clone() const override {
        return std::make_unique<StatelessModel>(m_shape, weight);
    }

    std::string architecture() const override {
        return "stateless";
    }
};

ModelRegistry mock_registry() {
    ModelRegistry registry;
    registry.add("mock", [](ModelShape const& shape) {
        return std::make_unique<MockModel>(shape, 0.0f);
    });
    registry.add("stateless", [](ModelShape const& shape) {
        return std::make_unique<StatelessModel>(shape, 0.0f);
    });
    return registry;
}

PolicyPool::Options mock_options(TempDir const& dir, int batch_size, std::vector<int> weights,
                                 std::uint64_t seed = 42) {
    int num_active_policies = int(weights.size());
    return {
        .evaluation_batch_size = batch_size,
        .sample_weights = std::move(weights),
        .num_active_policies = num_active_policies,
        .path = dir / "pool",
        .mu = 1000,
        .anchor_mu = 1000,
        .sigma = 100.0 / 3,
        .seed = seed,
        .registry = mock_registry(),
    };
}

std::vector<AgentInfos> uniform_infos(int envs, int agents, double score) {
    std::vector<AgentInfos> infos(envs);
    for (auto& env : infos) {
        for (int i = 0; i < agents; ++i) {
            env.push_back(folly::dynamic::object("score", score));
        }
    }
    return infos;
}

// Store that can be told to fail on writes.
struct FlakyStore : SqlitePolicyStore {
    bool fail_adds = false;
    bool fail_updates = false;

    FlakyStore() : SqlitePolicyStore{":memory:"} {}

    PolicyRecord add(PolicyRecord record, bool overwrite) override {
        if (fail_adds) {
            throw StorageFailure("database is locked");
        }
        return SqlitePolicyStore::add(std::move(record), overwrite);
    }

    void update_all(std::vector<PolicyRecord> const& records) override {
        if (fail_updates) {
            throw StorageFailure("disk I/O error");
        }
        SqlitePolicyStore::update_all(records);
    }
};

// Infos where every agent of `slot` scores `slot_score` and all others score `other_score`.
std::vector<AgentInfos> slot_infos(PolicyPool const& pool, int slot, double slot_score,
                                   double other_score) {
    std::vector<double> scores(pool.learner_mask().size(0), other_score);
    for (std::int64_t idx : pool.sample_indices()[slot]) {
        scores[idx] = slot_score;
    }

    std::vector<AgentInfos> infos(1);
    for (double score : scores) {
        infos[0].push_back(folly::dynamic::object("score", score));
    }
    return infos;
}

void rotate_into_slot(PolicyPool& pool, int slot, std::string const& name) {
    for (int i = 0; i < 200 && pool.active_policies()[slot] != name; ++i) {
        pool.update_active_policies();
    }
    REQUIRE(pool.active_policies()[slot] == name);
}

}  // namespace

TEST_CASE("Construction", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};

    PolicyPool pool{learner, "learner", store, mock_options(dir, 8, {3, 1})};

    auto record = store->get_by_name("learner");
    REQUIRE(record);
    CHECK(record->tenured());
    CHECK(record->mu == 1000);
    CHECK(record->sigma == 100.0 / 3);
    CHECK(record->episodes == 0);
    CHECK(record->architecture_tag == "mock");
    CHECK(record->snapshot_path == dir / "pool/learner");

    CHECK(pool.active_policies() == std::vector<std::string>{"learner", "learner"});
    CHECK(pool.ratings().at("learner").mu == 1000);
    CHECK(pool.sample_indices()[0] == std::vector<std::int64_t>{0, 1, 2, 4, 5, 6});
    CHECK(pool.sample_indices()[1] == std::vector<std::int64_t>{3, 7});
    CHECK(pool.learner_mask().sum().item<float>() == 6);
}

TEST_CASE("Invalid configuration", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};

    SECTION("Weights do not match roster size") {
        auto opts = mock_options(dir, 8, {3, 1});
        opts.num_active_policies = 3;
        CHECK_THROWS_AS(PolicyPool(learner, "learner", store, opts), ConfigurationError);
    }

    SECTION("Batch not divisible") {
        CHECK_THROWS_AS(PolicyPool(learner, "learner", store, mock_options(dir, 10, {3, 1})),
                        ConfigurationError);
    }

    SECTION("Missing batch size") {
        PolicyPool::Options opts{
            .sample_weights = {1},
            .num_active_policies = 1,
            .path = dir / "pool",
            .registry = mock_registry(),
        };
        CHECK_THROWS_AS(PolicyPool(learner, "learner", store, opts), ConfigurationError);
    }

    SECTION("Unknown architecture") {
        auto opts = mock_options(dir, 8, {3, 1});
        opts.registry = ModelRegistry{};
        CHECK_THROWS_AS(PolicyPool(learner, "learner", store, opts), ConfigurationError);
    }

    CHECK(store->get_all().empty());
}

TEST_CASE("Add policy", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};
    PolicyPool pool{learner, "learner", store, mock_options(dir, 8, {3, 1})};

    pool.add_policy(MockModel{kMockShape, 2}, "rival", false, 1100.0, 20.0);

    auto record = store->get_by_name("rival");
    REQUIRE(record);
    CHECK(record->mu == 1100);
    CHECK(record->sigma == 20);
    CHECK(record->episodes == 0);
    CHECK_FALSE(record->tenured());
    CHECK(pool.ratings().at("rival").mu == 1100);
    CHECK(pool.ratings().at("rival").sigma == 20);

    SECTION("Defaults") {
        pool.add_policy(MockModel{kMockShape, 3}, "default", true);
        CHECK(store->get_by_name("default")->mu == 1000);
        CHECK(store->get_by_name("default")->sigma == 100.0 / 3);
        CHECK(store->get_by_name("default")->tenured());
    }

    SECTION("Naming conflict") {
        CHECK_THROWS_AS(pool.add_policy(MockModel{kMockShape, 9}, "rival", true, 500.0, 1.0,
                                        false, false),
                        NamingConflict);

        auto unchanged = store->get_by_name("rival");
        CHECK(unchanged->mu == 1100);
        CHECK_FALSE(unchanged->tenured());

        MockModel snapshot{kMockShape, 0};
        snapshot.load(unchanged->snapshot_path);
        CHECK(snapshot.weight == 2);
    }

    SECTION("Overwrite") {
        pool.add_policy(MockModel{kMockShape, 9}, "rival", true, 500.0, 1.0);

        auto replaced = store->get_by_name("rival");
        CHECK(replaced->mu == 500);
        CHECK(replaced->tenured());
        CHECK(store->get_all().size() == 2);
    }

    SECTION("Anchor") {
        pool.add_policy(MockModel{kMockShape, 4}, "anchor", true, {}, {}, true);
        CHECK(pool.rating_engine().anchor() == "anchor");
        CHECK(store->get_by_name("anchor")->anchor());
    }
}

TEST_CASE("Snapshots are taken by value", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};
    PolicyPool pool{learner, "learner", store, mock_options(dir, 8, {3, 1})};

    MockModel live{kMockShape, 1};
    pool.add_policy(live, "frozen");
    live.weight = 5;

    MockModel snapshot{kMockShape, 0};
    snapshot.load(store->get_by_name("frozen")->snapshot_path);
    CHECK(snapshot.weight == 1);

    learner.weight = 8;
    pool.update_active_policies();
    auto output = pool.forward(torch::zeros({8, kMockShape.observation_size}));
    for (std::int64_t idx : pool.sample_indices()[0]) {
        CHECK(output.actions[idx].item<std::int64_t>() == 7);
    }
}

TEST_CASE("Add policy copy", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};
    PolicyPool pool{learner, "learner", store, mock_options(dir, 8, {3, 1})};

    pool.add_policy(MockModel{kMockShape, 3}, "veteran", false, 1234.0, 12.0);
    pool.add_policy_copy("veteran", "copy", true);

    auto copy = store->get_by_name("copy");
    REQUIRE(copy);
    CHECK(copy->mu == 1234);
    CHECK(copy->sigma == 12);
    CHECK(copy->tenured());
    CHECK(copy->snapshot_path != store->get_by_name("veteran")->snapshot_path);

    MockModel snapshot{kMockShape, 0};
    snapshot.load(copy->snapshot_path);
    CHECK(snapshot.weight == 3);

    CHECK_THROWS_AS(pool.add_policy_copy("missing", "other"), NotFound);
    CHECK_FALSE(store->get_by_name("other"));
}

TEST_CASE("Roster rotation", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    MockModel learner{kMockShape, 7};
    PolicyPool pool{learner, "learner", store, mock_options(dir, 16, {1, 1, 1, 1})};

    for (int i = 0; i < 5; ++i) {
        pool.add_policy(MockModel{kMockShape, float(i)}, "policy" + std::to_string(i));
    }

    for (int round = 0; round < 10; ++round) {
        pool.update_active_policies();
        auto roster = pool.active_policies();

        REQUIRE(roster.size() == 4);
        CHECK(roster.front() == "learner");
        for (auto const& name : roster) {
            CHECK(store->get_by_name(name));
        }
    }
}

TEST_CASE("Seeded rotation is reproducible", "[Policy Pool]") {
    auto make_roster = [](std::uint64_t seed) {
        TempDir dir;
        auto store = std::make_shared<SqlitePolicyStore>(":memory:");
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store,
                        mock_options(dir, 16, {1, 1, 1, 1}, seed)};

        for (int i = 0; i < 8; ++i) {
            pool.add_policy(MockModel{kMockShape, float(i)}, "policy" + std::to_string(i));
        }

        std::vector<std::vector<std::string>> rosters;
        for (int round = 0; round < 5; ++round) {
            pool.update_active_policies();
            rosters.push_back(pool.active_policies());
        }
        return rosters;
    };

    CHECK(make_roster(1) == make_roster(1));
    CHECK(make_roster(123) == make_roster(123));
}

TEST_CASE("Forward routes slots", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store,
                    mock_options(dir, 12, {2, 1, 1})};

    pool.add_policy(MockModel{kMockShape, 2}, "two");
    pool.add_policy(MockModel{kMockShape, 3}, "three");
    pool.update_active_policies();

    auto observations = torch::arange(12 * kMockShape.observation_size, torch::kFloat)
                            .view({12, kMockShape.observation_size});
    auto output = pool.forward(observations);

    REQUIRE(output.actions.size(0) == 12);
    REQUIRE(output.log_probs.size(0) == 12);
    REQUIRE(output.values.size(0) == 12);
    CHECK_FALSE(output.state);

    auto roster = pool.active_policies();
    for (int slot = 0; slot < 3; ++slot) {
        MockModel expected{kMockShape, 0};
        expected.load(store->get_by_name(roster[slot])->snapshot_path);

        for (std::int64_t idx : pool.sample_indices()[slot]) {
            CHECK(output.actions[idx].item<std::int64_t>() == std::int64_t(expected.weight));
            CHECK(output.log_probs[idx].item<float>() == -expected.weight);
            CHECK(output.values[idx].item<float>() == observations[idx][0].item<float>());
        }
    }

    CHECK_THROWS_AS(pool.forward(torch::zeros({6, kMockShape.observation_size})),
                    std::invalid_argument);
}

TEST_CASE("Forward updates recurrent state in place", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};

    RecurrentState state{torch::zeros({1, 8, kMockShape.hidden_size}),
                         torch::zeros({1, 8, kMockShape.hidden_size})};
    auto dones = torch::zeros({8}, torch::kBool);

    auto output = pool.forward(torch::zeros({8, kMockShape.observation_size}), state, dones);

    REQUIRE(output.state);
    CHECK(torch::all(state.hidden == 1).item<bool>());
    CHECK(torch::all(state.cell == 7).item<bool>());
    CHECK(torch::equal(output.state->hidden, state.hidden));
    CHECK(torch::equal(output.state->cell, state.cell));

    pool.forward(torch::zeros({8, kMockShape.observation_size}), state, dones);
    CHECK(torch::all(state.hidden == 2).item<bool>());
}

TEST_CASE("Update scores", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");

    SECTION("Missing metric is skipped") {
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 2, {1}, 1)};

        std::vector<AgentInfos> infos{
            {folly::dynamic::object("score", 1.0), folly::dynamic::object("length", 12)}};
        auto grouped = pool.update_scores(infos, "score");

        CHECK(pool.scores().at("learner") == std::vector<double>{1.0});
        CHECK(pool.num_scores() == 1);
        CHECK(grouped.at("learner").size() == 2);
    }

    SECTION("Slots sharing a name merge") {
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
        REQUIRE(pool.active_policies() == std::vector<std::string>{"learner", "learner"});

        pool.update_scores(uniform_infos(4, 2, 0.5), "score");

        REQUIRE(pool.scores().size() == 1);
        CHECK(pool.scores().at("learner").size() == 8);
    }

    SECTION("Scores follow the partition") {
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
        pool.add_policy(MockModel{kMockShape, 1}, "rival");

        // Rotate until the rival occupies slot 1.
        for (int i = 0; i < 100 && pool.active_policies()[1] != "rival"; ++i) {
            pool.update_active_policies();
        }
        REQUIRE(pool.active_policies()[1] == "rival");

        // Agent i scores i, so slot 1 (indices 3 and 7) gets 3 and 7.
        std::vector<AgentInfos> infos(2);
        for (int i = 0; i < 8; ++i) {
            infos[i / 4].push_back(folly::dynamic::object("score", i));
        }
        pool.update_scores(infos, "score");

        CHECK(pool.scores().at("learner") == std::vector<double>{0, 1, 2, 4, 5, 6});
        CHECK(pool.scores().at("rival") == std::vector<double>{3, 7});
    }

    SECTION("Malformed metric leaves the ledger untouched") {
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
        pool.update_scores(uniform_infos(4, 2, 1.0), "score");

        auto infos = uniform_infos(4, 2, 0.0);
        infos[2][0] = folly::dynamic::object("score", nullptr);
        CHECK_THROWS(pool.update_scores(infos, "score"));

        CHECK(pool.scores().at("learner") == std::vector<double>(8, 1.0));
        CHECK(pool.num_scores() == 8);
    }

    SECTION("Wrong number of agents") {
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
        CHECK_THROWS_AS(pool.update_scores(uniform_infos(3, 2, 1.0), "score"),
                        std::invalid_argument);
        CHECK(pool.scores().empty());
    }
}

TEST_CASE("Update ranks", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    auto rating = std::make_unique<MeanRating>();
    auto* mean_rating = rating.get();

    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, std::move(rating),
                    mock_options(dir, 8, {3, 1})};
    pool.add_policy(MockModel{kMockShape, 1}, "bystander", false, 1000.0, 30.0);

    SECTION("Scored names are written back") {
        // The bystander may be sampled into the roster, keep it out of the ledger.
        while (pool.active_policies()[1] != "learner") {
            pool.update_active_policies();
        }

        pool.update_scores(uniform_infos(4, 2, 0.25), "score");
        pool.update_ranks();

        CHECK(mean_rating->updates == 1);
        CHECK(pool.scores().empty());
        CHECK(pool.num_scores() == 0);

        auto learner = store->get_by_name("learner");
        CHECK(learner->mu == 0.25);
        CHECK(learner->sigma == 1.0 / 8);
        CHECK(learner->episodes == 8);
        CHECK(pool.ratings().at("learner").mu == 0.25);

        auto bystander = store->get_by_name("bystander");
        CHECK(bystander->mu == 1000);
        CHECK(bystander->sigma == 30);
        CHECK(bystander->episodes == 0);
    }

    SECTION("Removed policies are skipped") {
        while (pool.active_policies()[1] != "bystander") {
            pool.update_active_policies();
        }

        pool.update_scores(uniform_infos(4, 2, 1.0), "score");
        store->remove("bystander");
        pool.update_ranks();

        CHECK(pool.scores().empty());
        CHECK(store->get_by_name("learner")->mu == 1.0);
        CHECK_FALSE(store->get_by_name("bystander"));
    }

    SECTION("Empty ledger") {
        pool.update_ranks();
        CHECK(mean_rating->updates == 0);
        CHECK(store->get_by_name("learner")->mu == 1000);
    }
}

TEST_CASE("Failed write-back commits nothing", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>();
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, std::make_unique<MeanRating>(),
                    mock_options(dir, 8, {3, 1})};

    pool.update_scores(uniform_infos(4, 2, 1.0), "score");

    store->fail_updates = true;
    CHECK_THROWS_AS(pool.update_ranks(), StorageFailure);

    CHECK(pool.scores().at("learner").size() == 8);
    CHECK(pool.num_scores() == 8);
    CHECK(pool.ratings().at("learner").mu == 1000);
    CHECK(store->get_by_name("learner")->mu == 1000);

    store->fail_updates = false;
    pool.update_ranks();
    CHECK(pool.scores().empty());
    CHECK(pool.ratings().at("learner").mu == 1.0);
    CHECK(store->get_by_name("learner")->mu == 1.0);
}

TEST_CASE("Reopened store keeps ratings", "[Policy Pool]") {
    TempDir dir;
    std::string db = dir / "pool.db";

    {
        auto store = std::make_shared<SqlitePolicyStore>(db);
        PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
        pool.add_policy(MockModel{kMockShape, 1}, "veteran", true, 1400.0, 5.0);
        pool.add_policy(MockModel{kMockShape, 2}, "anchor", true, {}, {}, true);
    }

    auto store = std::make_shared<SqlitePolicyStore>(db);
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};

    CHECK(pool.ratings().at("veteran").mu == 1400);
    CHECK(pool.ratings().at("veteran").sigma == 5);
    CHECK(pool.rating_engine().anchor() == "anchor");
    CHECK(store->get_all().size() == 3);
}

TEST_CASE("Anchor changes", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};

    SECTION("Overwriting the anchor makes it a competitor") {
        pool.add_policy(MockModel{kMockShape, 1}, "a", true, {}, {}, true);
        pool.add_policy(MockModel{kMockShape, 1}, "a", true);

        CHECK_FALSE(pool.rating_engine().anchor());
        CHECK_FALSE(store->get_by_name("a")->anchor());

        rotate_into_slot(pool, 1, "a");
        pool.update_scores(slot_infos(pool, 1, 0.0, 1.0), "score");
        pool.update_ranks();

        CHECK(pool.ratings().at("a").mu < 1000);
        CHECK(store->get_by_name("a")->mu < 1000);
        CHECK(store->get_by_name("learner")->mu > 1000);
    }

    SECTION("A new anchor replaces the old one") {
        pool.add_policy(MockModel{kMockShape, 1}, "old", true, {}, {}, true);
        pool.add_policy(MockModel{kMockShape, 2}, "new", true, {}, {}, true);

        CHECK(pool.rating_engine().anchor() == "new");
        CHECK(store->get_by_name("new")->anchor());
        CHECK_FALSE(store->get_by_name("old")->anchor());
    }
}

TEST_CASE("Roster models follow the learner architecture", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};

    SECTION("Adding another architecture") {
        CHECK_THROWS_AS(pool.add_policy(StatelessModel{kMockShape, 1}, "stranger"),
                        ConfigurationError);
        CHECK_FALSE(store->get_by_name("stranger"));
        CHECK_FALSE(pool.ratings().contains("stranger"));
    }

    SECTION("Stored record of another architecture") {
        std::string path = dir / "stranger";
        StatelessModel{kMockShape, 1}.save(path);
        store->add({.name = "stranger",
                    .snapshot_path = path,
                    .architecture_tag = "stateless",
                    .mu = 1000,
                    .sigma = 10},
                   false);

        bool rejected = false;
        for (int i = 0; i < 200 && !rejected; ++i) {
            try {
                pool.update_active_policies();
            } catch (ConfigurationError const&) {
                rejected = true;
            }
        }

        CHECK(rejected);
        CHECK(pool.active_policies() == std::vector<std::string>{"learner", "learner"});
        CHECK_THROWS_AS(pool.add_policy_copy("stranger", "copy"), ConfigurationError);
    }
}

TEST_CASE("Stateless slots pass the state through", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");
    PolicyPool pool{StatelessModel{kMockShape, 3}, "learner", store, mock_options(dir, 8, {3, 1})};

    RecurrentState state{torch::full({1, 8, kMockShape.hidden_size}, 5.0),
                         torch::full({1, 8, kMockShape.hidden_size}, 6.0)};

    auto output = pool.forward(torch::zeros({8, kMockShape.observation_size}), state);

    REQUIRE(output.state);
    CHECK(torch::all(state.hidden == 5).item<bool>());
    CHECK(torch::all(state.cell == 6).item<bool>());
    CHECK(torch::equal(output.state->hidden, state.hidden));
    CHECK(torch::equal(output.state->cell, state.cell));
}

TEST_CASE("Failed insert keeps the old snapshot", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>();
    PolicyPool pool{MockModel{kMockShape, 7}, "learner", store, mock_options(dir, 8, {3, 1})};
    pool.add_policy(MockModel{kMockShape, 2}, "rival", false, 1100.0, 20.0);

    store->fail_adds = true;
    CHECK_THROWS_AS(pool.add_policy(MockModel{kMockShape, 9}, "rival", true, 500.0, 1.0),
                    StorageFailure);

    auto record = store->get_by_name("rival");
    REQUIRE(record);
    CHECK(record->mu == 1100);
    CHECK_FALSE(record->tenured());
    CHECK(pool.ratings().at("rival").mu == 1100);

    MockModel snapshot{kMockShape, 0};
    snapshot.load(record->snapshot_path);
    CHECK(snapshot.weight == 2);

    CHECK_FALSE(std::filesystem::exists(dir / "pool/rival.staged"));
}

TEST_CASE("Saving a policy without a pool", "[Policy Pool]") {
    TempDir dir;
    auto store = std::make_shared<SqlitePolicyStore>(":memory:");

    save_policy(*store, MockModel{kMockShape, 4}, dir / "pool", "keeper", true, 1300.0, 8.0, false,
                false);
    auto keeper = *store->get_by_name("keeper");
    keeper.episodes = 5;
    store->update(keeper);

    MockModel source{kMockShape, 0};
    source.load(keeper.snapshot_path);
    auto copy = save_policy(*store, source, dir / "pool", "copy", false, keeper.mu, keeper.sigma,
                            false, false);

    CHECK(copy.id);
    CHECK(copy.mu == 1300);
    CHECK(copy.sigma == 8);
    CHECK(store->get_all().size() == 2);

    auto unchanged = store->get_by_name("keeper");
    CHECK(unchanged->mu == 1300);
    CHECK(unchanged->episodes == 5);
    CHECK(unchanged->tenured());

    CHECK_THROWS_AS(save_policy(*store, MockModel{kMockShape, 9}, dir / "pool", "keeper", false,
                                1000.0, 1.0, false, false),
                    NamingConflict);

    MockModel snapshot{kMockShape, 0};
    snapshot.load(unchanged->snapshot_path);
    CHECK(snapshot.weight == 4);
}
