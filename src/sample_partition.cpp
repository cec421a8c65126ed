#include "sample_partition.hpp"

#include <algorithm>
#include <format>
#include <numeric>

#include "errors.hpp"

SamplePartition::SamplePartition(int batch_size, std::vector<int> weights)
    : m_batch_size{batch_size}, m_weights{std::move(weights)} {
    if (m_batch_size <= 0) {
        throw ConfigurationError(std::format("Batch size must be positive, got {}.", m_batch_size));
    }

    if (m_weights.empty()) {
        throw ConfigurationError("At least one sample weight is required.");
    }

    if (std::ranges::any_of(m_weights, [](int weight) { return weight <= 0; })) {
        throw ConfigurationError("Sample weights must be positive.");
    }

    int const chunk_size = std::accumulate(m_weights.begin(), m_weights.end(), 0);
    if (m_batch_size % chunk_size != 0) {
        throw ConfigurationError(
            std::format("Batch size {} is not divisible by the sum of sample weights {}.",
                        m_batch_size, chunk_size));
    }

    // Weights [3, 1] give the pattern [0, 0, 0, 1].
    std::vector<int> pattern;
    pattern.reserve(chunk_size);
    for (std::size_t slot = 0; slot < m_weights.size(); ++slot) {
        pattern.insert(pattern.end(), m_weights[slot], int(slot));
    }

    m_indices.resize(m_weights.size());
    for (int idx = 0; idx < m_batch_size; ++idx) {
        m_indices[pattern[idx % chunk_size]].push_back(idx);
    }

    for (auto const& slot_indices : m_indices) {
        m_index_tensors.push_back(torch::tensor(slot_indices, torch::kLong));
    }
}

int SamplePartition::batch_size() const {
    return m_batch_size;
}

int SamplePartition::num_slots() const {
    return int(m_weights.size());
}

std::vector<std::int64_t> const& SamplePartition::indices(int slot) const {
    return m_indices.at(slot);
}

std::vector<std::vector<std::int64_t>> const& SamplePartition::all_indices() const {
    return m_indices;
}

torch::Tensor const& SamplePartition::index_tensor(int slot) const {
    return m_index_tensors.at(slot);
}

torch::Tensor SamplePartition::learner_mask() const {
    torch::Tensor mask = torch::zeros({m_batch_size});
    mask.index_fill_(0, m_index_tensors.front(), 1);
    return mask;
}
