#include "route.hpp"

namespace hfvrp
{
    const char *to_string(TailStrategy strategy) noexcept
    {
        switch (strategy)
        {
        case TailStrategy::exhaustive_insertion:
            return "exhaustive-insertion";
        case TailStrategy::append_nearest:
            return "append-nearest";
        }

        return "unknown";
    }

    TailStrategy parse_tail_strategy(const std::string &name)
    {
        if (name == "exhaustive-insertion" || name == "exhaustive")
        {
            return TailStrategy::exhaustive_insertion;
        }

        if (name == "append-nearest" || name == "append")
        {
            return TailStrategy::append_nearest;
        }

        throw std::invalid_argument(fmt::format("Unknown tail strategy \"{}\"", name));
    }

    void RouteOptimizer::_check_nodes(const std::vector<size_t> &nodes) const
    {
        std::set<size_t> seen;
        for (auto node : nodes)
        {
            if (!_problem.contains(node))
            {
                throw ConfigurationError(fmt::format("Node {} is not covered by the {}x{} distance matrix", node, _problem.nodes_count(), _problem.nodes_count()));
            }

            if (node == _problem.depot || node == _problem.waypoints.first || node == _problem.waypoints.second)
            {
                throw ConfigurationError(fmt::format("Node {} is the depot or a waypoint and cannot be routed as a delivery", node));
            }

            if (!seen.insert(node).second)
            {
                throw ConfigurationError(fmt::format("Node {} appears twice in one trip", node));
            }
        }
    }

    void RouteOptimizer::_exhaustive_insertion(const std::vector<size_t> &order, Route &best) const
    {
        const auto [w1, w2] = _problem.waypoints;
        const std::pair<size_t, size_t> tails[] = {{w1, w2}, {w2, w1}};

        std::vector<size_t> base;
        base.reserve(order.size() + 1);
        base.push_back(_problem.depot);
        base.insert(base.end(), order.begin(), order.end());

        std::vector<size_t> path;
        path.reserve(base.size() + 3);
        for (const auto &[first, second] : tails)
        {
            // `first` goes before base[i], `second` before the j-th element of the extended path
            for (size_t i = 1; i <= base.size(); i++)
            {
                for (size_t j = i + 1; j <= base.size() + 1; j++)
                {
                    path.assign(base.begin(), base.begin() + i);
                    path.push_back(first);
                    path.insert(path.end(), base.begin() + i, base.end());
                    path.insert(path.begin() + j, second);
                    path.push_back(_problem.depot);

                    auto distance = path_distance(path);
                    if (distance < best.distance)
                    {
                        best.order = order;
                        best.path = path;
                        best.distance = distance;
                    }
                }
            }
        }
    }

    void RouteOptimizer::_append_nearest(const std::vector<size_t> &order, Route &best) const
    {
        auto [first, second] = _problem.waypoints;
        auto last = order.empty() ? _problem.depot : order.back();
        if (_problem.distance(last, second) < _problem.distance(last, first))
        {
            std::swap(first, second);
        }

        std::vector<size_t> path;
        path.reserve(order.size() + 4);
        path.push_back(_problem.depot);
        path.insert(path.end(), order.begin(), order.end());
        path.push_back(first);
        path.push_back(second);
        path.push_back(_problem.depot);

        auto distance = path_distance(path);
        if (distance < best.distance)
        {
            best.order = order;
            best.path = std::move(path);
            best.distance = distance;
        }
    }

    Route RouteOptimizer::optimize(const std::vector<size_t> &nodes) const
    {
        _check_nodes(nodes);

        Route best{{}, {}, std::numeric_limits<double>::infinity()};
        if (nodes.empty())
        {
            // Only the waypoint order is left to choose, which both strategies settle the same way
            _exhaustive_insertion(nodes, best);
            return best;
        }

        std::vector<size_t> order(nodes);
        std::sort(order.begin(), order.end());
        do
        {
            if (_strategy == TailStrategy::exhaustive_insertion)
            {
                _exhaustive_insertion(order, best);
            }
            else
            {
                _append_nearest(order, best);
            }
        } while (std::next_permutation(order.begin(), order.end()));

        return best;
    }

    double RouteOptimizer::path_distance(const std::vector<size_t> &path) const
    {
        double result = 0.0;
        for (size_t i = 1; i < path.size(); i++)
        {
            result += _problem.distance(path[i - 1], path[i]);
        }
        return result;
    }
}
