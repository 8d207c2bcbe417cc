#pragma once

#include "solution.hpp"

namespace hfvrp
{
    struct ValidationReport
    {
        std::vector<std::string> errors;

        inline bool valid() const noexcept
        {
            return errors.empty();
        }
    };

    /// @brief Recomputes coverage, capacities, paths, distances and costs of a completed solution
    /// straight from the problem tables and lists every mismatch.
    ///
    /// `expected` is the delivery set the solution must cover; every trip path must start and
    /// end at the depot and contain both waypoints exactly once.
    ValidationReport validate(const Problem &problem, const Solution &solution, const std::vector<size_t> &expected);

    inline ValidationReport validate(const Problem &problem, const Solution &solution)
    {
        return validate(problem, solution, problem.delivery_nodes());
    }
}
