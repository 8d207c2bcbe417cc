#pragma once

#include "route.hpp"

namespace hfvrp
{
    struct Trip
    {
        /// @brief Index into Problem::vehicles.
        size_t vehicle;

        /// @brief Assigned delivery nodes, ascending.
        std::vector<size_t> nodes;

        Route route;

        explicit Trip(size_t vehicle, std::vector<size_t> nodes, Route route)
            : vehicle(vehicle), nodes(std::move(nodes)), route(std::move(route)) {}

        inline double fixed_cost(const Problem &problem) const
        {
            return problem.vehicles[vehicle].fixed_cost;
        }

        inline double fuel_cost(const Problem &problem) const
        {
            return route.distance * problem.vehicles[vehicle].fuel_cost;
        }

        inline double cost(const Problem &problem) const
        {
            return fixed_cost(problem) + fuel_cost(problem);
        }
    };

    /// @brief Snapshot of one assignment of deliveries to vehicles.
    ///
    /// Solutions are ordered by the lexicographic objective: any completed solution beats any
    /// incomplete one, then lower total cost wins, then fewer vehicles, then shorter distance.
    class Solution
    {
    private:
        std::vector<Trip> _trips;
        double _fixed_cost;
        double _fuel_cost;
        double _total_distance;
        bool _completed;

        explicit Solution(std::vector<Trip> &&trips, double fixed_cost, double fuel_cost, double total_distance, bool completed)
            : _trips(std::move(trips)), _fixed_cost(fixed_cost), _fuel_cost(fuel_cost), _total_distance(total_distance), _completed(completed) {}

    public:
        /// @brief Placeholder for "nothing found yet"; worse than every completed solution.
        static Solution incomplete();

        /// @brief Completed solution made of `trips`, with all aggregates computed from the problem tables.
        static Solution from_trips(const Problem &problem, std::vector<Trip> trips);

        inline const std::vector<Trip> &trips() const noexcept
        {
            return _trips;
        }

        inline double fixed_cost() const noexcept
        {
            return _fixed_cost;
        }

        inline double fuel_cost() const noexcept
        {
            return _fuel_cost;
        }

        inline double total_cost() const noexcept
        {
            return _fixed_cost + _fuel_cost;
        }

        inline size_t vehicles_used() const noexcept
        {
            return _trips.size();
        }

        inline double total_distance() const noexcept
        {
            return _total_distance;
        }

        inline bool completed() const noexcept
        {
            return _completed;
        }

        bool is_better_than(const Solution &other) const noexcept;
    };

    /// @brief `less` means `a` is the better solution. Incomplete solutions are all equivalent.
    std::weak_ordering compare(const Solution &a, const Solution &b) noexcept;
}
