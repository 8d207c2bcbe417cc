#pragma once

#include "solution.hpp"

namespace hfvrp
{
    struct TripAnalysis
    {
        std::string vehicle;
        Load load;
        Load capacity;
        double h_utilization;
        double k_utilization;
        double distance;

        /// @brief Depot, deliveries in nearest-neighbour order, both waypoints, depot.
        double reference_distance;

        inline double average_utilization() const noexcept
        {
            return (h_utilization + k_utilization) / 2.0;
        }

        /// @brief Actual over reference distance; below 1.0 means the route beats the greedy tour.
        inline double efficiency_ratio() const noexcept
        {
            return reference_distance > 0.0 ? distance / reference_distance : std::numeric_limits<double>::infinity();
        }
    };

    struct SolutionAnalysis
    {
        std::vector<TripAnalysis> trips;
        double h_utilization;
        double k_utilization;
        double fixed_cost_share;
        double fuel_cost_share;
        double efficiency_ratio;
    };

    /// @brief Utilization, route efficiency and cost breakdown of a completed solution. Ratios
    /// are percentages except for the efficiency ratios.
    SolutionAnalysis analyze(const Problem &problem, const Solution &solution);
}
