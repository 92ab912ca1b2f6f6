#pragma once

#include <stdexcept>
#include <string>

// Lookup of a word index that was never assigned.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};

// Vectors of unequal length handed to an operation that needs them aligned.
class DimensionMismatchError : public std::runtime_error {
public:
    explicit DimensionMismatchError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid or unrecognized configuration. Raised at setup time.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};
