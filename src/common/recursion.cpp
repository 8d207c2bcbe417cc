#include "recursion.hpp"
#include "capacity.hpp"

namespace hfvrp
{
    PartitionSearch::PartitionSearch(const Problem &problem, SearchConfig config, Logger logger)
        : _problem(problem),
          _config(std::move(config)),
          _logger(logger),
          _optimizer(problem, _config.tail_strategy),
          _min_node_distance(_config.min_node_distance.value_or(problem.min_incoming_distance())),
          _used(problem.vehicles_count(), false),
          _best(Solution::incomplete())
    {
        if (!(_config.pruning_tolerance >= 0.0))
        {
            throw ConfigurationError(fmt::format("Pruning tolerance must be non-negative, got {}", _config.pruning_tolerance));
        }

        if (!(_min_node_distance >= 0.0))
        {
            throw ConfigurationError(fmt::format("Minimum node distance must be non-negative, got {}", _min_node_distance));
        }
    }

    double PartitionSearch::efficiency(const Vehicle &vehicle, double fuel_weight) noexcept
    {
        auto capacity = static_cast<double>(vehicle.capacity.h + vehicle.capacity.k);
        auto cost = vehicle.fixed_cost + fuel_weight * vehicle.fuel_cost;
        if (cost <= 0.0)
        {
            return capacity > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
        }

        return capacity / cost;
    }

    std::vector<size_t> PartitionSearch::vehicle_order(const std::vector<size_t> &vehicles) const
    {
        std::vector<size_t> result(vehicles);
        std::stable_sort(
            result.begin(), result.end(),
            [&](size_t a, size_t b)
            {
                return efficiency(_problem.vehicles[a], _config.fuel_weight) > efficiency(_problem.vehicles[b], _config.fuel_weight);
            });
        return result;
    }

    Solution PartitionSearch::solve()
    {
        std::vector<size_t> vehicles(_problem.vehicles_count());
        std::iota(vehicles.begin(), vehicles.end(), 0);
        return solve(_problem.delivery_nodes(), vehicles);
    }

    Solution PartitionSearch::solve(const std::vector<size_t> &nodes, const std::vector<size_t> &vehicles)
    {
        std::vector<size_t> unassigned(nodes);
        std::sort(unassigned.begin(), unassigned.end());
        if (std::adjacent_find(unassigned.begin(), unassigned.end()) != unassigned.end())
        {
            throw ConfigurationError("Delivery node listed twice");
        }

        for (auto node : unassigned)
        {
            _problem.demand(node);
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

        _vehicles = vehicle_order(vehicles);
        _used.assign(_problem.vehicles_count(), false);
        _trips.clear();
        _best = Solution::incomplete();
        _stats = SearchStats();
        _timer = std::chrono::steady_clock::now();

        _logger.log(1, "Searching {} deliveries with {} vehicles, tolerance {}, {} waypoint placement",
                    unassigned.size(), _vehicles.size(), _config.pruning_tolerance, to_string(_optimizer.strategy()));

        _solve(unassigned, 0);

        if (!_trips.empty())
        {
            throw InvariantError(fmt::format("{} trips left on the stack after the search", _trips.size()));
        }

        return _best;
    }

    bool PartitionSearch::_out_of_budget()
    {
        if (_stats.aborted)
        {
            return true;
        }

        if (_config.call_limit.has_value() && _stats.calls > *_config.call_limit)
        {
            _stats.aborted = true;
        }
        else if (_config.time_limit.has_value() && std::chrono::steady_clock::now() - _timer >= *_config.time_limit)
        {
            _stats.aborted = true;
        }

        if (_stats.aborted)
        {
            _logger.log(0, "Search budget exhausted after {} calls, keeping the best solution so far", _stats.calls);
        }

        return _stats.aborted;
    }

    void PartitionSearch::_evaluate(size_t depth)
    {
        _stats.complete_solutions++;

        auto candidate = Solution::from_trips(_problem, _trips);
        std::string indent(2 * depth, ' ');
        _logger.log(1, "{}Complete: cost {} (fixed {}, fuel {}), {} vehicles, distance {}",
                    indent, candidate.total_cost(), candidate.fixed_cost(), candidate.fuel_cost(),
                    candidate.vehicles_used(), candidate.total_distance());

        if (candidate.is_better_than(_best))
        {
            _stats.improvements++;
            _logger.log(1, "{}New best solution", indent);
            _best = std::move(candidate);
        }
    }

    bool PartitionSearch::_should_prune(const std::vector<size_t> &unassigned, size_t depth)
    {
        if (!_best.completed())
        {
            return false;
        }

        double current = 0.0;
        for (const auto &trip : _trips)
        {
            current += trip.cost(_problem);
        }

        auto min_fixed_cost = std::numeric_limits<double>::infinity();
        auto min_fuel_cost = std::numeric_limits<double>::infinity();
        for (auto vehicle : _vehicles)
        {
            if (!_used[vehicle])
            {
                min_fixed_cost = std::min(min_fixed_cost, _problem.vehicles[vehicle].fixed_cost);
                min_fuel_cost = std::min(min_fuel_cost, _problem.vehicles[vehicle].fuel_cost);
            }
        }

        // No vehicle left but deliveries remain
        if (!std::isfinite(min_fixed_cost))
        {
            return true;
        }

        auto bound = current + min_fixed_cost + min_fuel_cost * _min_node_distance * static_cast<double>(unassigned.size());
        if (bound > _best.total_cost() * (1.0 + _config.pruning_tolerance))
        {
            _logger.log(1, "{}Pruned: bound {} exceeds best {} beyond tolerance", std::string(2 * depth, ' '), bound, _best.total_cost());
            return true;
        }

        return false;
    }

    const Route &PartitionSearch::_route(const std::vector<size_t> &nodes)
    {
        auto iter = _routes.find(nodes);
        if (iter == _routes.end())
        {
            iter = _routes.emplace(nodes, _optimizer.optimize(nodes)).first;
            _logger.log(2, "Route {}: distance {}", format_nodes(iter->second.path), iter->second.distance);
        }

        return iter->second;
    }

    void PartitionSearch::_push(size_t vehicle, const std::vector<size_t> &nodes, const Route &route)
    {
        if (_used[vehicle])
        {
            throw InvariantError(fmt::format("Vehicle {} assigned to a second trip", _problem.vehicles[vehicle].name));
        }

        _used[vehicle] = true;
        _trips.emplace_back(vehicle, nodes, route);
    }

    void PartitionSearch::_pop(size_t vehicle)
    {
        if (_trips.empty() || _trips.back().vehicle != vehicle || !_used[vehicle])
        {
            throw InvariantError(fmt::format("Backtracking vehicle {} that is not on top of the trip stack", _problem.vehicles[vehicle].name));
        }

        _trips.pop_back();
        _used[vehicle] = false;
    }

    void PartitionSearch::_solve(const std::vector<size_t> &unassigned, size_t depth)
    {
        _stats.calls++;
        if (_out_of_budget())
        {
            return;
        }

        if (unassigned.empty())
        {
            _evaluate(depth);
            return;
        }

        if (_should_prune(unassigned, depth))
        {
            _stats.pruned++;
            return;
        }

        std::string indent(2 * depth, ' ');
        _logger.log(1, "{}Depth {}: assigning {}", indent, depth, format_nodes(unassigned));

        auto n = unassigned.size();
        std::vector<size_t> subset, rest, indices;
        for (auto vehicle : _vehicles)
        {
            if (_used[vehicle])
            {
                continue;
            }

            const auto &details = _problem.vehicles[vehicle];
            _logger.log(1, "{}Trying vehicle {} (fixed {}, fuel {}, capacity {}/{})", indent, details.name, details.fixed_cost, details.fuel_cost, details.capacity.h, details.capacity.k);

            for (size_t size = n; size > 0; size--)
            {
                // Lexicographic walk over all index combinations of the given size
                indices.resize(size);
                std::iota(indices.begin(), indices.end(), 0);
                while (true)
                {
                    subset.clear();
                    for (auto i : indices)
                    {
                        subset.push_back(unassigned[i]);
                    }

                    if (!fits_capacity(_problem, subset, details.capacity))
                    {
                        _stats.capacity_rejections++;
                        _logger.log(2, "{}{} exceeds capacity of {}", indent, format_nodes(subset), details.name);
                    }
                    else
                    {
                        rest.clear();
                        std::set_difference(unassigned.begin(), unassigned.end(), subset.begin(), subset.end(), std::back_inserter(rest));

                        _push(vehicle, subset, _route(subset));
                        _solve(rest, depth + 1);
                        _pop(vehicle);

                        if (_stats.aborted)
                        {
                            return;
                        }
                    }

                    size_t i = size;
                    while (i > 0 && indices[i - 1] == n - size + i - 1)
                    {
                        i--;
                    }

                    if (i == 0)
                    {
                        break;
                    }

                    indices[i - 1]++;
                    for (size_t j = i; j < size; j++)
                    {
                        indices[j] = indices[j - 1] + 1;
                    }
                }
            }
        }
    }
}
