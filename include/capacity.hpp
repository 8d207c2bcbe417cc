#pragma once

#include "problem.hpp"

namespace hfvrp
{
    /// @throws ConfigurationError if a node has no entry in the demand table
    Load total_demand(const Problem &problem, const std::vector<size_t> &nodes);

    /// @brief Whether a vehicle of the given capacity can carry the summed demand of `nodes`.
    bool fits_capacity(const Problem &problem, const std::vector<size_t> &nodes, const Load &capacity);
}
