#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "policy_model.hpp"

using ModelFactory = std::function<std::unique_ptr<PolicyModel>(ModelShape const&)>;

// Maps the architecture tag stored with every policy record to a factory that allocates an
// untrained model of that architecture. Snapshots are always materialized through here.
class ModelRegistry {
public:
    void add(std::string tag, ModelFactory factory);

    bool contains(std::string const& tag) const;
    std::vector<std::string> architectures() const;

    // Throws ConfigurationError for unknown tags.
    std::unique_ptr<PolicyModel> create(std::string const& tag, ModelShape const& shape) const;

private:
    std::map<std::string, ModelFactory> m_factories;
};

// Registry that knows the built-in libtorch architectures.
ModelRegistry default_registry();
