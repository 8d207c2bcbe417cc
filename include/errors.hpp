#pragma once

#include "pch.hpp"

namespace hfvrp
{
    /// @brief Raised when the input tables are inconsistent with each other, e.g. a node id that
    /// the distance matrix or the demand table does not cover.
    class ConfigurationError : public std::runtime_error
    {
    public:
        explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
    };

    /// @brief Raised when the search breaks one of its own bookkeeping rules (a vehicle assigned
    /// twice, a backtrack without a matching push). Never a normal search outcome.
    class InvariantError : public std::logic_error
    {
    public:
        explicit InvariantError(const std::string &message) : std::logic_error(message) {}
    };
}
