#include "solution.hpp"

namespace hfvrp
{
    Solution Solution::incomplete()
    {
        return Solution({}, 0.0, 0.0, 0.0, false);
    }

    Solution Solution::from_trips(const Problem &problem, std::vector<Trip> trips)
    {
        double fixed_cost = 0.0, fuel_cost = 0.0, total_distance = 0.0;
        for (const auto &trip : trips)
        {
            fixed_cost += trip.fixed_cost(problem);
            fuel_cost += trip.fuel_cost(problem);
            total_distance += trip.route.distance;
        }

        return Solution(std::move(trips), fixed_cost, fuel_cost, total_distance, true);
    }

    bool Solution::is_better_than(const Solution &other) const noexcept
    {
        return compare(*this, other) == std::weak_ordering::less;
    }

    std::weak_ordering compare(const Solution &a, const Solution &b) noexcept
    {
        if (a.completed() != b.completed())
        {
            return a.completed() ? std::weak_ordering::less : std::weak_ordering::greater;
        }

        if (!a.completed())
        {
            return std::weak_ordering::equivalent;
        }

        if (a.total_cost() != b.total_cost())
        {
            return a.total_cost() < b.total_cost() ? std::weak_ordering::less : std::weak_ordering::greater;
        }

        if (a.vehicles_used() != b.vehicles_used())
        {
            return a.vehicles_used() < b.vehicles_used() ? std::weak_ordering::less : std::weak_ordering::greater;
        }

        if (a.total_distance() != b.total_distance())
        {
            return a.total_distance() < b.total_distance() ? std::weak_ordering::less : std::weak_ordering::greater;
        }

        return std::weak_ordering::equivalent;
    }
}
