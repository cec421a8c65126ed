#include "model_registry.hpp"

#include <format>

#include "actor_critic.hpp"
#include "errors.hpp"

void ModelRegistry::add(std::string tag, ModelFactory factory) {
    m_factories.insert_or_assign(std::move(tag), std::move(factory));
}

bool ModelRegistry::contains(std::string const& tag) const {
    return m_factories.contains(tag);
}

std::vector<std::string> ModelRegistry::architectures() const {
    std::vector<std::string> result;

    for (auto const& [tag, _] : m_factories) {
        result.push_back(tag);
    }

    return result;
}

std::unique_ptr<PolicyModel> ModelRegistry::create(std::string const& tag,
                                                   ModelShape const& shape) const {
    auto it = m_factories.find(tag);

    if (it == m_factories.end()) {
        throw ConfigurationError(std::format("Unknown model architecture \"{}\"!", tag));
    }

    return it->second(shape);
}

ModelRegistry default_registry() {
    ModelRegistry registry;
    registry.add(kMlpArchitecture,
                 [](ModelShape const& shape) { return std::make_unique<MlpPolicy>(shape); });
    registry.add(kLstmArchitecture,
                 [](ModelShape const& shape) { return std::make_unique<LstmPolicy>(shape); });
    return registry;
}
