#include "validation.hpp"

namespace hfvrp
{
    namespace
    {
        constexpr double EPSILON = 1.0e-6;

        bool _differs(double a, double b) noexcept
        {
            return std::abs(a - b) > EPSILON * std::max(1.0, std::max(std::abs(a), std::abs(b)));
        }
    }

    ValidationReport validate(const Problem &problem, const Solution &solution, const std::vector<size_t> &expected)
    {
        ValidationReport report;
        auto &errors = report.errors;
        if (!solution.completed())
        {
            errors.push_back("Solution is not completed");
            return report;
        }

        std::map<size_t, size_t> visits;
        std::map<size_t, size_t> vehicle_uses;
        double fixed_cost = 0.0, fuel_cost = 0.0, total_distance = 0.0;
        for (const auto &trip : solution.trips())
        {
            if (trip.vehicle >= problem.vehicles_count())
            {
                errors.push_back(fmt::format("Unknown vehicle index {}", trip.vehicle));
                continue;
            }

            const auto &vehicle = problem.vehicles[trip.vehicle];
            vehicle_uses[trip.vehicle]++;

            Load load{0, 0};
            for (auto node : trip.nodes)
            {
                visits[node]++;
                auto iter = problem.demands.find(node);
                if (iter == problem.demands.end())
                {
                    errors.push_back(fmt::format("Vehicle {}: node {} is not a delivery node", vehicle.name, node));
                    continue;
                }
                load += iter->second;
            }

            if (load.h > vehicle.capacity.h)
            {
                errors.push_back(fmt::format("Vehicle {}: H capacity exceeded ({} > {})", vehicle.name, load.h, vehicle.capacity.h));
            }

            if (load.k > vehicle.capacity.k)
            {
                errors.push_back(fmt::format("Vehicle {}: K capacity exceeded ({} > {})", vehicle.name, load.k, vehicle.capacity.k));
            }

            const auto &path = trip.route.path;
            if (path.size() < 4 || path.front() != problem.depot || path.back() != problem.depot)
            {
                errors.push_back(fmt::format("Vehicle {}: path does not start and end at depot {}", vehicle.name, problem.depot));
                continue;
            }

            auto first_count = std::count(path.begin(), path.end(), problem.waypoints.first);
            auto second_count = std::count(path.begin(), path.end(), problem.waypoints.second);
            if (first_count != 1 || second_count != 1)
            {
                errors.push_back(fmt::format("Vehicle {}: waypoints {} and {} visited {} and {} times", vehicle.name,
                                             problem.waypoints.first, problem.waypoints.second, first_count, second_count));
            }

            std::vector<size_t> deliveries;
            for (size_t i = 1; i + 1 < path.size(); i++)
            {
                auto node = path[i];
                if (node == problem.depot)
                {
                    errors.push_back(fmt::format("Vehicle {}: path returns to the depot early", vehicle.name));
                }
                else if (node != problem.waypoints.first && node != problem.waypoints.second)
                {
                    deliveries.push_back(node);
                }
            }

            if (deliveries != trip.route.order)
            {
                errors.push_back(fmt::format("Vehicle {}: path disagrees with the visiting order", vehicle.name));
            }

            std::sort(deliveries.begin(), deliveries.end());
            std::vector<size_t> assigned(trip.nodes);
            std::sort(assigned.begin(), assigned.end());
            if (deliveries != assigned)
            {
                errors.push_back(fmt::format("Vehicle {}: path does not visit exactly the assigned nodes", vehicle.name));
            }

            double distance = 0.0;
            bool known = true;
            for (size_t i = 1; i < path.size(); i++)
            {
                if (!problem.contains(path[i - 1]) || !problem.contains(path[i]))
                {
                    known = false;
                    break;
                }
                distance += problem.distance_matrix[path[i - 1]][path[i]];
            }

            if (!known)
            {
                errors.push_back(fmt::format("Vehicle {}: path leaves the distance matrix", vehicle.name));
            }
            else if (_differs(distance, trip.route.distance))
            {
                errors.push_back(fmt::format("Vehicle {}: reported distance {}, calculated {}", vehicle.name, trip.route.distance, distance));
            }

            fixed_cost += vehicle.fixed_cost;
            fuel_cost += distance * vehicle.fuel_cost;
            total_distance += distance;
        }

        for (const auto &[vehicle, count] : vehicle_uses)
        {
            if (count > 1)
            {
                errors.push_back(fmt::format("Vehicle {} used {} times", problem.vehicles[vehicle].name, count));
            }
        }

        for (auto node : expected)
        {
            if (visits.find(node) == visits.end())
            {
                errors.push_back(fmt::format("Node {} is not delivered", node));
            }
        }

        std::set<size_t> expected_set(expected.begin(), expected.end());
        for (const auto &[node, count] : visits)
        {
            if (count > 1)
            {
                errors.push_back(fmt::format("Node {} delivered {} times", node, count));
            }

            if (expected_set.find(node) == expected_set.end())
            {
                errors.push_back(fmt::format("Node {} delivered but not requested", node));
            }
        }

        if (_differs(fixed_cost, solution.fixed_cost()))
        {
            errors.push_back(fmt::format("Fixed cost: reported {}, calculated {}", solution.fixed_cost(), fixed_cost));
        }

        if (_differs(fuel_cost, solution.fuel_cost()))
        {
            errors.push_back(fmt::format("Fuel cost: reported {}, calculated {}", solution.fuel_cost(), fuel_cost));
        }

        if (_differs(fixed_cost + fuel_cost, solution.total_cost()))
        {
            errors.push_back(fmt::format("Total cost: reported {}, calculated {}", solution.total_cost(), fixed_cost + fuel_cost));
        }

        if (_differs(total_distance, solution.total_distance()))
        {
            errors.push_back(fmt::format("Total distance: reported {}, calculated {}", solution.total_distance(), total_distance));
        }

        return report;
    }
}
