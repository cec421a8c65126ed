#include "actor_critic.hpp"

#include <folly/logging/xlog.h>

#include <stdexcept>

namespace {

struct SampledActions {
    torch::Tensor actions;
    torch::Tensor log_probs;
};

SampledActions sample_actions(torch::Tensor const& logits) {
    torch::Tensor log_probs = torch::log_softmax(logits, -1);
    torch::Tensor actions = torch::multinomial(log_probs.exp(), 1);

    return {actions.squeeze(-1), log_probs.gather(-1, actions).squeeze(-1)};
}

void check_observations(torch::Tensor const& observations, ModelShape const& shape) {
    if (observations.dim() != 2 || observations.size(1) != shape.observation_size) {
        throw std::invalid_argument("Observations must be [batch, observation_size]!");
    }
}

}  // namespace

MlpNetImpl::MlpNetImpl(ModelShape shape) : shape{shape} {
    reset();
}

void MlpNetImpl::reset() {
    lin1 = register_module("lin1", torch::nn::Linear(shape.observation_size, shape.hidden_size));
    lin2 = register_module("lin2", torch::nn::Linear(shape.hidden_size, shape.hidden_size));
    actor = register_module("actor", torch::nn::Linear(shape.hidden_size, shape.action_count));
    critic = register_module("critic", torch::nn::Linear(shape.hidden_size, 1));
}

MlpNetImpl::Result MlpNetImpl::forward(torch::Tensor x) {
    x = torch::relu(lin1->forward(x));
    x = torch::relu(lin2->forward(x));

    return {actor->forward(x), critic->forward(x).squeeze(-1)};
}

LstmNetImpl::LstmNetImpl(ModelShape shape) : shape{shape} {
    reset();
}

void LstmNetImpl::reset() {
    encoder =
        register_module("encoder", torch::nn::Linear(shape.observation_size, shape.hidden_size));
    lstm = register_module("lstm", torch::nn::LSTM(torch::nn::LSTMOptions(shape.hidden_size,
                                                                          shape.hidden_size)));
    actor = register_module("actor", torch::nn::Linear(shape.hidden_size, shape.action_count));
    critic = register_module("critic", torch::nn::Linear(shape.hidden_size, 1));
}

LstmNetImpl::Result LstmNetImpl::forward(torch::Tensor x, RecurrentState state) {
    x = torch::relu(encoder->forward(x));

    // A single time step: [1, batch, hidden].
    auto [output, new_state] =
        lstm->forward(x.unsqueeze(0), std::make_tuple(state.hidden, state.cell));
    x = output.squeeze(0);

    return {actor->forward(x), critic->forward(x).squeeze(-1),
            {std::get<0>(new_state), std::get<1>(new_state)}};
}

MlpPolicy::MlpPolicy(ModelShape shape) : MlpPolicy{MlpNet{shape}} {}

MlpPolicy::MlpPolicy(MlpNet net) : PolicyModel{net->shape}, m_net{std::move(net)} {}

PolicyOutput MlpPolicy::act(torch::Tensor observations, std::optional<RecurrentState>,
                            std::optional<torch::Tensor>) {
    check_observations(observations, m_shape);

    torch::NoGradGuard guard;
    auto result = m_net->forward(observations.to(m_net->lin1->weight.device()));
    auto [actions, log_probs] = sample_actions(result.logits);

    return {actions, log_probs, result.value, std::nullopt};
}

void MlpPolicy::save(std::string const& path) const {
    torch::save(m_net, path);
}

void MlpPolicy::load(std::string const& path) {
    torch::load(m_net, path);
}

std::unique_ptr<PolicyModel> MlpPolicy::clone() const {
    return std::make_unique<MlpPolicy>(
        MlpNet{std::dynamic_pointer_cast<MlpNetImpl>(m_net->clone())});
}

std::string MlpPolicy::architecture() const {
    return kMlpArchitecture;
}

MlpNet const& MlpPolicy::net() const {
    return m_net;
}

LstmPolicy::LstmPolicy(ModelShape shape) : LstmPolicy{LstmNet{shape}} {}

LstmPolicy::LstmPolicy(LstmNet net) : PolicyModel{net->shape}, m_net{std::move(net)} {}

PolicyOutput LstmPolicy::act(torch::Tensor observations, std::optional<RecurrentState> state,
                             std::optional<torch::Tensor> dones) {
    check_observations(observations, m_shape);

    torch::NoGradGuard guard;
    auto device = m_net->encoder->weight.device();

    if (!state) {
        XLOG(DBG, "No recurrent state supplied, starting from zeros.");
        state = initial_state(observations.size(0));
    }

    RecurrentState current{state->hidden.to(device), state->cell.to(device)};

    if (dones) {
        // Agents whose episode ended start over from a zero state.
        auto keep = (1 - dones->to(device, torch::kFloat)).view({1, -1, 1});
        current.hidden = current.hidden * keep;
        current.cell = current.cell * keep;
    }

    auto result = m_net->forward(observations.to(device), current);
    auto [actions, log_probs] = sample_actions(result.logits);

    return {actions, log_probs, result.value, result.state};
}

void LstmPolicy::save(std::string const& path) const {
    torch::save(m_net, path);
}

void LstmPolicy::load(std::string const& path) {
    torch::load(m_net, path);
}

std::unique_ptr<PolicyModel> LstmPolicy::clone() const {
    return std::make_unique<LstmPolicy>(
        LstmNet{std::dynamic_pointer_cast<LstmNetImpl>(m_net->clone())});
}

std::string LstmPolicy::architecture() const {
    return kLstmArchitecture;
}

bool LstmPolicy::recurrent() const {
    return true;
}

RecurrentState LstmPolicy::initial_state(int batch_size) const {
    auto options = torch::TensorOptions().device(m_net->encoder->weight.device());
    return {torch::zeros({1, batch_size, m_shape.hidden_size}, options),
            torch::zeros({1, batch_size, m_shape.hidden_size}, options)};
}

LstmNet const& LstmPolicy::net() const {
    return m_net;
}
