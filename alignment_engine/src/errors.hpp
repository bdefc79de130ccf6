#pragma once

#include <stdexcept>
#include <string>

// Raised for malformed lexicons, out-of-range weights, duplicate terms and
// impossible configuration. Insufficient data is never an error.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};
