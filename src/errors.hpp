#pragma once

#include <stdexcept>

// Invalid pool configuration (sample weights, batch size, unknown architecture).
class ConfigurationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class NamingConflict : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class NotFound : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised for any failure of the underlying storage engine. Not retried.
class StorageFailure : public std::runtime_error {
    using std::runtime_error::runtime_error;
};
