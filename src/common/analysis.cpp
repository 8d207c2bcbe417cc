#include "analysis.hpp"
#include "capacity.hpp"

namespace hfvrp
{
    namespace
    {
        double _percentage(uint64_t part, uint64_t whole) noexcept
        {
            return whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
        }

        double _reference_distance(const Problem &problem, std::vector<size_t> remaining)
        {
            double result = 0.0;
            auto current = problem.depot;
            while (!remaining.empty())
            {
                auto nearest = std::min_element(
                    remaining.begin(), remaining.end(),
                    [&](size_t a, size_t b)
                    {
                        return problem.distance(current, a) < problem.distance(current, b);
                    });
                result += problem.distance(current, *nearest);
                current = *nearest;
                remaining.erase(nearest);
            }

            result += problem.distance(current, problem.waypoints.first);
            result += problem.distance(problem.waypoints.first, problem.waypoints.second);
            result += problem.distance(problem.waypoints.second, problem.depot);
            return result;
        }
    }

    SolutionAnalysis analyze(const Problem &problem, const Solution &solution)
    {
        SolutionAnalysis result{{}, 0.0, 0.0, 0.0, 0.0, 0.0};
        Load demand{0, 0}, capacity{0, 0};
        double distance = 0.0, reference = 0.0;
        for (const auto &trip : solution.trips())
        {
            const auto &vehicle = problem.vehicles[trip.vehicle];
            auto load = total_demand(problem, trip.nodes);

            TripAnalysis analysis{
                vehicle.name,
                load,
                vehicle.capacity,
                _percentage(load.h, vehicle.capacity.h),
                _percentage(load.k, vehicle.capacity.k),
                trip.route.distance,
                _reference_distance(problem, trip.nodes),
            };

            demand += load;
            capacity += vehicle.capacity;
            distance += analysis.distance;
            reference += analysis.reference_distance;
            result.trips.push_back(std::move(analysis));
        }

        result.h_utilization = _percentage(demand.h, capacity.h);
        result.k_utilization = _percentage(demand.k, capacity.k);
        if (solution.total_cost() > 0.0)
        {
            result.fixed_cost_share = 100.0 * solution.fixed_cost() / solution.total_cost();
            result.fuel_cost_share = 100.0 * solution.fuel_cost() / solution.total_cost();
        }
        result.efficiency_ratio = reference > 0.0 ? distance / reference : std::numeric_limits<double>::infinity();

        return result;
    }
}
