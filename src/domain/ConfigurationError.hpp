/**
 * @file ConfigurationError.hpp
 * @brief Raised when the batching session cannot be configured.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace provenance::domain {

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace provenance::domain
