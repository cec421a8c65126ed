#include "policy_pool.hpp"

#include <folly/String.h>
#include <folly/logging/xlog.h>

#include <filesystem>
#include <format>
#include <stdexcept>
#include <system_error>

#include "errors.hpp"

namespace {

SamplePartition checked_partition(PolicyPool::Options const& opts) {
    if (int(opts.sample_weights.size()) != opts.num_active_policies) {
        throw ConfigurationError(
            std::format("Got {} sample weights for {} active policies.", opts.sample_weights.size(),
                        opts.num_active_policies));
    }

    return SamplePartition{opts.evaluation_batch_size, opts.sample_weights};
}

torch::Tensor batch_buffer(torch::Tensor const& like, int batch_size) {
    auto sizes = like.sizes().vec();
    sizes[0] = batch_size;
    return torch::zeros(sizes, like.options());
}

}  // namespace

PolicyRecord save_policy(PolicyStore& store, PolicyModel const& model, std::string const& root,
                         std::string const& name, bool tenured, double mu, double sigma,
                         bool anchor, bool overwrite_existing) {
    if (store.get_by_name(name) && !overwrite_existing) {
        throw NamingConflict(std::format("A policy with the name '{}' already exists.", name));
    }

    std::filesystem::path path = std::filesystem::path{root} / name;
    std::filesystem::path staged = path;
    staged += ".staged";

    if (auto folder = path.parent_path(); !folder.empty()) {
        std::filesystem::create_directories(folder);
    }
    // A private copy, later changes to `model` never reach the snapshot.
    model.clone()->save(staged.string());

    PolicyRecord record{
        .name = name,
        .snapshot_path = path.string(),
        .architecture_tag = model.architecture(),
        .mu = mu,
        .sigma = sigma,
        .episodes = 0,
    };
    record.set_tenured(tenured);
    record.metadata["anchor"] = anchor;

    try {
        record = store.add(std::move(record), overwrite_existing);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(staged, ec);
        throw;
    }

    std::filesystem::rename(staged, path);

    if (anchor) {
        std::vector<PolicyRecord> replaced;
        for (PolicyRecord& other : store.get_all()) {
            if (other.name != name && other.anchor()) {
                other.metadata["anchor"] = false;
                replaced.push_back(std::move(other));
            }
        }

        if (!replaced.empty()) {
            store.update_all(replaced);
        }
    }

    return record;
}

PolicyPool::PolicyPool(PolicyModel const& learner, std::string name,
                       std::shared_ptr<PolicyStore> store, Options opts)
    : PolicyPool{learner, std::move(name), std::move(store),
                 std::make_unique<OpenSkillRating>(opts.mu, opts.anchor_mu, opts.sigma), opts} {}

PolicyPool::PolicyPool(PolicyModel const& learner, std::string name,
                       std::shared_ptr<PolicyStore> store, std::unique_ptr<RatingEngine> rating,
                       Options opts)
    : m_learner_shape{learner.shape()},
      m_learner_architecture{learner.architecture()},
      m_learner_name{std::move(name)},
      m_store{std::move(store)},
      m_rating{std::move(rating)},
      m_opts{std::move(opts)},
      m_partition{checked_partition(m_opts)},
      m_twister{m_opts.seed} {
    if (!m_store || !m_rating) {
        throw std::invalid_argument("PolicyPool needs a store and a rating engine!");
    }

    if (!m_opts.registry.contains(m_learner_architecture)) {
        throw ConfigurationError(
            std::format("Learner architecture \"{}\" is not registered.", m_learner_architecture));
    }

    XLOGF(INFO, "Creating policy pool with {} active policies and weights [{}].",
          m_opts.num_active_policies, folly::join(", ", m_opts.sample_weights));

    // Policies from earlier runs keep their stored ratings.
    for (PolicyRecord const& record : m_store->get_all()) {
        if (record.anchor()) {
            m_rating->set_anchor(record.name);
        } else {
            m_rating->add_policy(record.name);
            m_rating->ratings()[record.name] = Rating{record.mu, record.sigma};
        }
    }

    add_policy(learner, m_learner_name, true, m_opts.mu, m_opts.sigma, false, true);
    update_active_policies();
}

void PolicyPool::add_policy(PolicyModel const& model, std::string const& name, bool tenured,
                            std::optional<double> mu, std::optional<double> sigma, bool anchor,
                            bool overwrite_existing) {
    if (model.architecture() != m_learner_architecture) {
        throw ConfigurationError(std::format("Policy {} is a {} model, the pool runs {} models.",
                                             name, model.architecture(), m_learner_architecture));
    }

    double const initial_mu = mu.value_or(m_opts.mu);
    double const initial_sigma = sigma.value_or(m_opts.sigma);

    save_policy(*m_store, model, m_opts.path, name, tenured, initial_mu, initial_sigma, anchor,
                overwrite_existing);

    if (anchor) {
        m_rating->set_anchor(name);
    } else {
        if (m_rating->anchor() == name) {
            m_rating->clear_anchor();
        }

        m_rating->add_policy(name);
        m_rating->ratings()[name] = Rating{initial_mu, initial_sigma};
    }

    XLOGF(INFO, "Added policy {} (tenured: {}, anchor: {}, mu: {}, sigma: {}).", name, tenured,
          anchor, initial_mu, initial_sigma);
}

void PolicyPool::add_policy_copy(std::string const& source, std::string const& name,
                                 bool tenured, bool anchor) {
    auto source_record = m_store->get_by_name(source);

    if (!source_record) {
        throw NotFound(std::format("Policy with name '{}' does not exist.", source));
    }

    auto model = materialize(*source_record);
    add_policy(*model, name, tenured, source_record->mu, source_record->sigma, anchor);
}

void PolicyPool::update_active_policies() {
    auto learner = m_store->get_by_name(m_learner_name);

    if (!learner) {
        throw NotFound(std::format("Learner policy '{}' is missing from the store.", m_learner_name));
    }

    auto all_policies = m_store->get_all();
    std::uniform_int_distribution<std::size_t> choice(0, all_policies.size() - 1);

    std::vector<ActivePolicy> active_policies;
    active_policies.reserve(m_opts.num_active_policies);
    active_policies.push_back({*learner, nullptr});

    for (int i = 1; i < m_opts.num_active_policies; ++i) {
        active_policies.push_back({all_policies[choice(m_twister)], nullptr});
    }

    // Every slot runs its own snapshot in a fresh instance, even if a name appears twice.
    for (ActivePolicy& policy : active_policies) {
        policy.model = materialize(policy.record);
    }

    m_active_policies = std::move(active_policies);
    XLOGF(INFO, "Active policies: {}", folly::join(", ", active_policies()));
}

PoolOutput PolicyPool::forward(torch::Tensor const& observations,
                               std::optional<RecurrentState> state,
                               std::optional<torch::Tensor> dones) {
    int const batch_size = m_partition.batch_size();

    if (observations.size(0) != batch_size) {
        throw std::invalid_argument(std::format("Expected a batch of {} observations, got {}.",
                                                batch_size, observations.size(0)));
    }

    for (int slot = 0; slot < m_partition.num_slots(); ++slot) {
        torch::Tensor const& samples = m_partition.index_tensor(slot);
        ActivePolicy& policy = m_active_policies[slot];

        std::optional<RecurrentState> slot_state;
        if (state) {
            auto idx = samples.to(state->hidden.device());
            slot_state = RecurrentState{state->hidden.index_select(1, idx),
                                        state->cell.index_select(1, idx)};
        }

        std::optional<torch::Tensor> slot_dones;
        if (dones) {
            slot_dones = dones->index_select(0, samples.to(dones->device()));
        }

        PolicyOutput result = policy.model->act(
            observations.index_select(0, samples.to(observations.device())), slot_state,
            slot_dones);

        if (!m_allocated) {
            allocate_buffers(result, state);
        }

        auto idx = samples.to(m_actions.device());
        m_actions.index_copy_(0, idx, result.actions.to(m_actions.options()));
        m_log_probs.index_copy_(0, idx, result.log_probs.flatten().to(m_log_probs.options()));
        m_values.index_copy_(0, idx, result.values.flatten().to(m_values.options()));

        if (state) {
            if (!m_hidden.defined()) {
                m_hidden = torch::zeros_like(state->hidden);
                m_cell = torch::zeros_like(state->cell);
            }

            auto state_idx = samples.to(state->hidden.device());

            if (result.state) {
                auto hidden = result.state->hidden.to(state->hidden.options());
                auto cell = result.state->cell.to(state->cell.options());

                state->hidden.index_copy_(1, state_idx, hidden);
                state->cell.index_copy_(1, state_idx, cell);
                m_hidden.index_copy_(1, state_idx, hidden);
                m_cell.index_copy_(1, state_idx, cell);
            } else {
                m_hidden.index_copy_(1, state_idx, slot_state->hidden);
                m_cell.index_copy_(1, state_idx, slot_state->cell);
            }
        }

        XLOGF(DBG, "Slot {} ({}) handled {} samples.", slot, policy.record.name,
              samples.size(0));
    }

    PoolOutput output{m_actions, m_log_probs, m_values, std::nullopt};
    if (state) {
        output.state = RecurrentState{m_hidden, m_cell};
    }

    return output;
}

std::map<std::string, std::vector<folly::dynamic>> PolicyPool::update_scores(
    std::vector<AgentInfos> const& infos, std::string const& metric_key) {
    // TODO: support sparse infos where some agents did not report this step.
    std::vector<folly::dynamic const*> agent_infos;
    for (AgentInfos const& env_infos : infos) {
        for (folly::dynamic const& info : env_infos) {
            agent_infos.push_back(&info);
        }
    }

    if (int(agent_infos.size()) != m_partition.batch_size()) {
        throw std::invalid_argument(std::format("Expected infos for {} agents, got {}.",
                                                m_partition.batch_size(), agent_infos.size()));
    }

    std::map<std::string, std::vector<folly::dynamic>> policy_infos;

    // Collected separately so a malformed metric leaves the ledger untouched.
    std::map<std::string, std::vector<double>> new_scores;
    std::int64_t num_new_scores = 0;

    for (int slot = 0; slot < m_partition.num_slots(); ++slot) {
        std::string const& name = m_active_policies[slot].record.name;
        auto& grouped = policy_infos[name];

        for (std::int64_t idx : m_partition.indices(slot)) {
            folly::dynamic const& info = *agent_infos[idx];
            grouped.push_back(info);

            folly::dynamic const* metric = info.isObject() ? info.get_ptr(metric_key) : nullptr;
            if (!metric) {
                continue;
            }

            new_scores[name].push_back(metric->asDouble());
            ++num_new_scores;
        }
    }

    for (auto& [name, policy_scores] : new_scores) {
        auto& ledger = m_scores[name];
        ledger.insert(ledger.end(), policy_scores.begin(), policy_scores.end());
    }
    m_num_scores += num_new_scores;

    return policy_infos;
}

void PolicyPool::update_ranks() {
    if (m_scores.empty()) {
        XLOG(DBG, "No scores recorded since the last rank update.");
        return;
    }

    std::vector<std::string> names;
    std::vector<std::vector<double>> samples;

    for (auto const& [name, policy_scores] : m_scores) {
        names.push_back(name);
        samples.push_back(policy_scores);
    }

    auto previous_ratings = m_rating->ratings();

    try {
        m_rating->update(names, samples);

        std::vector<PolicyRecord> records;
        for (auto const& [name, policy_scores] : m_scores) {
            auto record = m_store->get_by_name(name);

            if (!record) {
                XLOGF(WARN, "Policy {} was removed from the store, skipping its rating.", name);
                continue;
            }

            Rating const& rating = m_rating->ratings().at(name);
            record->mu = rating.mu;
            record->sigma = rating.sigma;
            record->episodes += std::int64_t(policy_scores.size());
            records.push_back(std::move(*record));
        }

        m_store->update_all(records);
    } catch (...) {
        // Keep the engine consistent with the store, the ledger stays for a later attempt.
        m_rating->ratings() = std::move(previous_ratings);
        throw;
    }

    XLOGF(INFO, "Updated ranks of {} policies from {} scores.", names.size(), m_num_scores);

    m_scores.clear();
    m_num_scores = 0;
}

std::map<std::string, Rating> const& PolicyPool::ratings() const {
    return m_rating->ratings();
}

RatingEngine const& PolicyPool::rating_engine() const {
    return *m_rating;
}

std::vector<std::string> PolicyPool::active_policies() const {
    std::vector<std::string> names;

    for (ActivePolicy const& policy : m_active_policies) {
        names.push_back(policy.record.name);
    }

    return names;
}

std::vector<std::vector<std::int64_t>> const& PolicyPool::sample_indices() const {
    return m_partition.all_indices();
}

torch::Tensor PolicyPool::learner_mask() const {
    return m_partition.learner_mask();
}

std::map<std::string, std::vector<double>> const& PolicyPool::scores() const {
    return m_scores;
}

std::int64_t PolicyPool::num_scores() const {
    return m_num_scores;
}

PolicyStore& PolicyPool::store() {
    return *m_store;
}

std::unique_ptr<PolicyModel> PolicyPool::materialize(PolicyRecord const& record) const {
    if (record.architecture_tag != m_learner_architecture) {
        throw ConfigurationError(std::format("Policy {} is a {} model, the pool runs {} models.",
                                             record.name, record.architecture_tag,
                                             m_learner_architecture));
    }

    auto model = m_opts.registry.create(m_learner_architecture, m_learner_shape);
    model->load(record.snapshot_path);
    return model;
}

void PolicyPool::allocate_buffers(PolicyOutput const& first,
                                  std::optional<RecurrentState> const& state) {
    int const batch_size = m_partition.batch_size();

    m_actions = batch_buffer(first.actions, batch_size);
    m_log_probs = torch::zeros({batch_size}, first.log_probs.options());
    m_values = torch::zeros({batch_size}, first.values.options());

    if (state) {
        m_hidden = torch::zeros_like(state->hidden);
        m_cell = torch::zeros_like(state->cell);
    }

    m_allocated = true;
}
