#include "policy_record.hpp"

#include <folly/Conv.h>

bool PolicyRecord::tenured() const {
    if (!metadata.isObject()) {
        return false;
    }

    return coerce_to_bool(metadata.get_ptr("tenured"));
}

void PolicyRecord::set_tenured(bool tenured) {
    if (!metadata.isObject()) {
        metadata = folly::dynamic::object;
    }

    metadata["tenured"] = tenured;
}

bool PolicyRecord::anchor() const {
    return metadata.isObject() && coerce_to_bool(metadata.get_ptr("anchor"));
}

bool coerce_to_bool(folly::dynamic const* value) {
    if (!value) {
        return false;
    }

    switch (value->type()) {
        case folly::dynamic::BOOL:
            return value->getBool();
        case folly::dynamic::INT64:
            return value->getInt() != 0;
        case folly::dynamic::DOUBLE:
            return value->getDouble() != 0.0;
        case folly::dynamic::STRING: {
            if (value->getString().empty()) {
                return false;
            }
            auto result = folly::tryTo<bool>(value->getString());
            return result.hasValue() && *result;
        }
        default:
            return false;
    }
}
