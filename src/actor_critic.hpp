#pragma once

#include <torch/torch.h>

#include "policy_model.hpp"

struct MlpNetImpl : torch::nn::Cloneable<MlpNetImpl> {
    ModelShape shape;

    torch::nn::Linear lin1{nullptr}, lin2{nullptr};
    torch::nn::Linear actor{nullptr}, critic{nullptr};

    explicit MlpNetImpl(ModelShape shape);

    void reset() override;

    struct Result {
        torch::Tensor logits;
        torch::Tensor value;
    };

    Result forward(torch::Tensor x);
};

TORCH_MODULE(MlpNet);

struct LstmNetImpl : torch::nn::Cloneable<LstmNetImpl> {
    ModelShape shape;

    torch::nn::Linear encoder{nullptr};
    torch::nn::LSTM lstm{nullptr};
    torch::nn::Linear actor{nullptr}, critic{nullptr};

    explicit LstmNetImpl(ModelShape shape);

    void reset() override;

    struct Result {
        torch::Tensor logits;
        torch::Tensor value;
        RecurrentState state;
    };

    Result forward(torch::Tensor x, RecurrentState state);
};

TORCH_MODULE(LstmNet);

class MlpPolicy : public PolicyModel {
public:
    explicit MlpPolicy(ModelShape shape);
    explicit MlpPolicy(MlpNet net);

    PolicyOutput act(torch::Tensor observations, std::optional<RecurrentState> state,
                     std::optional<torch::Tensor> dones) override;

    void save(std::string const& path) const override;
    void load(std::string const& path) override;
    std::unique_ptr<PolicyModel> clone() const override;
    std::string architecture() const override;

    MlpNet const& net() const;

private:
    MlpNet m_net;
};

class LstmPolicy : public PolicyModel {
public:
    explicit LstmPolicy(ModelShape shape);
    explicit LstmPolicy(LstmNet net);

    PolicyOutput act(torch::Tensor observations, std::optional<RecurrentState> state,
                     std::optional<torch::Tensor> dones) override;

    void save(std::string const& path) const override;
    void load(std::string const& path) override;
    std::unique_ptr<PolicyModel> clone() const override;
    std::string architecture() const override;
    bool recurrent() const override;

    // Zero state for `batch_size` agents on the device of the network.
    RecurrentState initial_state(int batch_size) const;

    LstmNet const& net() const;

private:
    LstmNet m_net;
};

inline constexpr char const* kMlpArchitecture = "mlp";
inline constexpr char const* kLstmArchitecture = "lstm";
