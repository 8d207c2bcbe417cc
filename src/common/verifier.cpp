#include "verifier.hpp"
#include "capacity.hpp"

#include <ortools/linear_solver/linear_solver.h>

namespace hfvrp
{
    namespace
    {
        using operations_research::MPConstraint;
        using operations_research::MPSolver;
        using operations_research::MPVariable;

        struct Column
        {
            size_t vehicle;
            uint32_t mask;
            double cost;
            double distance;
            const Route *route;
            MPVariable *variable;
        };

        /// Keeps the next stage within the optimum of the previous one
        void _fix_objective(MPSolver &solver, const std::vector<Column> &columns, double (*weight)(const Column &), double optimum, const char *name)
        {
            auto slack = 1.0e-6 * std::max(1.0, std::abs(optimum));
            MPConstraint *constraint = solver.MakeRowConstraint(-solver.infinity(), optimum + slack, name);
            for (const auto &column : columns)
            {
                constraint->SetCoefficient(column.variable, weight(column));
            }
        }

        bool _minimize(MPSolver &solver, const std::vector<Column> &columns, double (*weight)(const Column &))
        {
            auto *objective = solver.MutableObjective();
            objective->Clear();
            for (const auto &column : columns)
            {
                objective->SetCoefficient(column.variable, weight(column));
            }
            objective->SetMinimization();
            return solver.Solve() == MPSolver::OPTIMAL;
        }

        double _cost(const Column &column)
        {
            return column.cost;
        }

        double _vehicle(const Column &)
        {
            return 1.0;
        }

        double _distance(const Column &column)
        {
            return column.distance;
        }
    }

    double VerifiedSolution::fixed_cost() const noexcept
    {
        double result = 0.0;
        for (const auto &route : routes)
        {
            result += route.fixed_cost;
        }
        return result;
    }

    double VerifiedSolution::fuel_cost() const noexcept
    {
        double result = 0.0;
        for (const auto &route : routes)
        {
            result += route.fuel_cost;
        }
        return result;
    }

    double VerifiedSolution::total_distance() const noexcept
    {
        double result = 0.0;
        for (const auto &route : routes)
        {
            result += route.distance;
        }
        return result;
    }

    VerifiedSolution to_verified(const Problem &problem, const Solution &solution)
    {
        VerifiedSolution result{solution.total_cost(), {}};
        for (const auto &trip : solution.trips())
        {
            result.routes.push_back(VerifiedRoute{
                problem.vehicles[trip.vehicle].name,
                trip.nodes,
                trip.route.path,
                trip.route.distance,
                trip.fixed_cost(problem),
                trip.fuel_cost(problem),
            });
        }
        return result;
    }

    std::optional<VerifiedSolution> SetPartitionVerifier::solve() const
    {
        std::vector<size_t> vehicles(_problem.vehicles_count());
        std::iota(vehicles.begin(), vehicles.end(), 0);
        return solve(vehicles);
    }

    std::optional<VerifiedSolution> SetPartitionVerifier::solve(const std::vector<size_t> &vehicles) const
    {
        auto nodes = _problem.delivery_nodes();
        auto n = nodes.size();
        if (n > MAX_NODES)
        {
            throw ConfigurationError(fmt::format("Set-partition verifier handles at most {} deliveries, got {}", MAX_NODES, n));
        }

        std::set<size_t> seen;
        for (auto vehicle : vehicles)
        {
            if (vehicle >= _problem.vehicles_count())
            {
                throw ConfigurationError(fmt::format("Unknown vehicle index {}", vehicle));
            }

            if (!seen.insert(vehicle).second)
            {
                throw ConfigurationError(fmt::format("Vehicle {} listed twice", _problem.vehicles[vehicle].name));
            }
        }

        if (n == 0)
        {
            return VerifiedSolution{0.0, {}};
        }

        std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(_backend));
        if (!solver)
        {
            throw ConfigurationError(fmt::format("MIP backend {} is not available", _backend));
        }

        RouteOptimizer optimizer(_problem, _strategy);
        auto full = static_cast<uint32_t>((uint64_t(1) << n) - 1);

        // Routes do not depend on the vehicle, only capacities and prices do
        std::vector<std::vector<size_t>> subsets(size_t(full) + 1);
        std::vector<Load> loads(size_t(full) + 1, Load{0, 0});
        for (uint32_t mask = 1; mask <= full; mask++)
        {
            for (size_t i = 0; i < n; i++)
            {
                if (mask & (uint32_t(1) << i))
                {
                    subsets[mask].push_back(nodes[i]);
                }
            }
            loads[mask] = total_demand(_problem, subsets[mask]);
        }

        std::vector<std::optional<Route>> routes(size_t(full) + 1);
        std::vector<Column> columns;
        for (auto v : vehicles)
        {
            const auto &vehicle = _problem.vehicles[v];
            MPConstraint *once = solver->MakeRowConstraint(0.0, 1.0, fmt::format("vehicle_{}", vehicle.name));
            for (uint32_t mask = 1; mask <= full; mask++)
            {
                if (!loads[mask].fits_within(vehicle.capacity))
                {
                    continue;
                }

                if (!routes[mask].has_value())
                {
                    routes[mask] = optimizer.optimize(subsets[mask]);
                }

                const auto &route = *routes[mask];
                auto *variable = solver->MakeBoolVar(fmt::format("route_{}_{}", vehicle.name, mask));
                once->SetCoefficient(variable, 1.0);
                columns.push_back(Column{v, mask, vehicle.fixed_cost + vehicle.fuel_cost * route.distance, route.distance, &route, variable});
            }
        }

        for (size_t i = 0; i < n; i++)
        {
            MPConstraint *cover = solver->MakeRowConstraint(1.0, 1.0, fmt::format("cover_{}", nodes[i]));
            for (const auto &column : columns)
            {
                if (column.mask & (uint32_t(1) << i))
                {
                    cover->SetCoefficient(column.variable, 1.0);
                }
            }
        }

        _logger.log(1, "Set-partition model: {} deliveries, {} vehicles, {} columns, {} backend",
                    n, vehicles.size(), columns.size(), _backend);

        if (!_minimize(*solver, columns, _cost))
        {
            _logger.log(0, "Set-partition model has no optimal solution");
            return std::nullopt;
        }

        auto best_cost = solver->Objective().Value();
        _fix_objective(*solver, columns, _cost, best_cost, "best_cost");
        if (!_minimize(*solver, columns, _vehicle))
        {
            throw InvariantError("Set-partition model lost its optimum while minimizing vehicles");
        }

        _fix_objective(*solver, columns, _vehicle, solver->Objective().Value(), "best_vehicles");
        if (!_minimize(*solver, columns, _distance))
        {
            throw InvariantError("Set-partition model lost its optimum while minimizing distance");
        }

        VerifiedSolution result{0.0, {}};
        for (const auto &column : columns)
        {
            if (column.variable->solution_value() > 0.5)
            {
                const auto &vehicle = _problem.vehicles[column.vehicle];
                result.routes.push_back(VerifiedRoute{
                    vehicle.name,
                    subsets[column.mask],
                    column.route->path,
                    column.distance,
                    vehicle.fixed_cost,
                    vehicle.fuel_cost * column.distance,
                });
                result.total_cost += column.cost;
            }
        }

        return result;
    }

    bool SolutionComparison::agree() const noexcept
    {
        return std::abs(cost_difference) < 1.0e-6 && vehicle_difference == 0;
    }

    SolutionComparison compare_solutions(const VerifiedSolution &a, const VerifiedSolution &b) noexcept
    {
        return SolutionComparison{
            a.total_cost - b.total_cost,
            static_cast<long long>(a.routes.size()) - static_cast<long long>(b.routes.size()),
            a.total_distance() - b.total_distance(),
        };
    }
}
