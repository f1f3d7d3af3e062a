#pragma once

#include <stdexcept>
#include <string>

namespace slg {

/**
 * @brief Unreadable or missing corpus, empty corpus, or unwritable output
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid length policy, context width or option value
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Non-fatal outcome recorded by the pipeline (e.g. a graph with no edges)
 */
struct DegenerateResultWarning {
    std::string stage;
    std::string message;
};

} // namespace slg
