#pragma once

#include <stdexcept>
#include <string>

namespace spcode {

    /// Raised synchronously when a solver or config is constructed with bad parameters
    class InvalidConfigurationError : public std::invalid_argument {
    public:
        explicit InvalidConfigurationError(const std::string& msg)
            : std::invalid_argument(msg) {}
    };

    /// Raised by the NaN guard (and degenerate step sizes) during inference
    class NumericInstabilityError : public std::runtime_error {
    public:
        explicit NumericInstabilityError(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /// Dictionary / data / warm start dimensions disagree
    class ShapeMismatchError : public std::invalid_argument {
    public:
        explicit ShapeMismatchError(const std::string& msg)
            : std::invalid_argument(msg) {}
    };

} // namespace spcode
