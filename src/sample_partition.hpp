#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <vector>

// Assignment of batch indices to roster slots. Slot `i` owns `weights[i]` out of every
// `sum(weights)` consecutive indices, so the slots are interleaved rather than contiguous.
class SamplePartition {
public:
    // Throws ConfigurationError unless all weights are positive and `batch_size` is a positive
    // multiple of their sum.
    SamplePartition(int batch_size, std::vector<int> weights);

    int batch_size() const;
    int num_slots() const;

    // Ascending batch indices owned by `slot`.
    std::vector<std::int64_t> const& indices(int slot) const;
    std::vector<std::vector<std::int64_t>> const& all_indices() const;

    // The same indices as an int64 tensor, for index_select / index_put_.
    torch::Tensor const& index_tensor(int slot) const;

    // 1 for indices owned by slot 0 (the learner), 0 elsewhere.
    torch::Tensor learner_mask() const;

private:
    int m_batch_size;
    std::vector<int> m_weights;
    std::vector<std::vector<std::int64_t>> m_indices;
    std::vector<torch::Tensor> m_index_tensors;
};
