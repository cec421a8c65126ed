#include "policy_model.hpp"

PolicyModel::PolicyModel(ModelShape shape) : m_shape{shape} {}

bool PolicyModel::recurrent() const {
    return false;
}

ModelShape const& PolicyModel::shape() const {
    return m_shape;
}
