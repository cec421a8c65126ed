#pragma once

#include <torch/torch.h>

#include <memory>
#include <optional>
#include <string>

struct ModelShape {
    int observation_size;
    int action_count;
    int hidden_size = 128;
};

// LSTM state, both tensors are [layers, batch, hidden].
struct RecurrentState {
    torch::Tensor hidden;
    torch::Tensor cell;
};

// All tensors are batch-first. `state` is only set by recurrent models.
struct PolicyOutput {
    torch::Tensor actions;
    torch::Tensor log_probs;
    torch::Tensor values;
    std::optional<RecurrentState> state;
};

class PolicyModel {
public:
    // Samples an action for every observation. Recurrent models expect `state` and reset it for
    // every agent flagged in `dones` before stepping.
    virtual PolicyOutput act(torch::Tensor observations, std::optional<RecurrentState> state,
                             std::optional<torch::Tensor> dones) = 0;

    virtual void save(std::string const& path) const = 0;
    virtual void load(std::string const& path) = 0;

    // Deep copy, parameters included.
    virtual std::unique_ptr<PolicyModel> clone() const = 0;

    virtual std::string architecture() const = 0;
    virtual bool recurrent() const;

    ModelShape const& shape() const;

    PolicyModel(PolicyModel const& other) = delete;
    PolicyModel(PolicyModel&& other) = delete;

    PolicyModel& operator=(PolicyModel const& other) = delete;
    PolicyModel& operator=(PolicyModel&& other) = delete;

    virtual ~PolicyModel() = default;

protected:
    ModelShape m_shape;

    explicit PolicyModel(ModelShape shape);
};
