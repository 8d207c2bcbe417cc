#include "capacity.hpp"

namespace hfvrp
{
    Load total_demand(const Problem &problem, const std::vector<size_t> &nodes)
    {
        Load result{0, 0};
        for (auto node : nodes)
        {
            result += problem.demand(node);
        }
        return result;
    }

    bool fits_capacity(const Problem &problem, const std::vector<size_t> &nodes, const Load &capacity)
    {
        return total_demand(problem, nodes).fits_within(capacity);
    }
}
