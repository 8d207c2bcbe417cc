#pragma once

#include "problem.hpp"

namespace hfvrp
{
    /// @brief How the two mandatory waypoints are placed into a visiting order.
    enum class TailStrategy
    {
        /// Try every position for both waypoints in both relative orders. Always optimal.
        exhaustive_insertion,
        /// Append the waypoint nearer to the last delivery, then the other one. Faster, but can
        /// miss the optimum when a waypoint lies close to an early delivery.
        append_nearest,
    };

    const char *to_string(TailStrategy strategy) noexcept;

    /// @throws std::invalid_argument on an unknown strategy name
    TailStrategy parse_tail_strategy(const std::string &name);

    struct Route
    {
        /// @brief Visiting order of the delivery nodes only.
        std::vector<size_t> order;

        /// @brief Physical path: depot, deliveries and both waypoints, back to the depot.
        std::vector<size_t> path;

        double distance;
    };

    class RouteOptimizer
    {
    private:
        const Problem &_problem;
        TailStrategy _strategy;

        void _check_nodes(const std::vector<size_t> &nodes) const;
        void _exhaustive_insertion(const std::vector<size_t> &order, Route &best) const;
        void _append_nearest(const std::vector<size_t> &order, Route &best) const;

    public:
        explicit RouteOptimizer(const Problem &problem, TailStrategy strategy = TailStrategy::exhaustive_insertion) noexcept
            : _problem(problem), _strategy(strategy) {}

        inline TailStrategy strategy() const noexcept
        {
            return _strategy;
        }

        /// @brief Shortest depot-to-depot path visiting every node of `nodes` and both waypoints.
        ///
        /// Enumerates every permutation of `nodes`, so the cost grows factorially with the
        /// number of deliveries on one trip. Ties keep the first path found, with permutations
        /// taken in lexicographic order of node ids, which makes the result deterministic.
        ///
        /// @throws ConfigurationError if a node is not covered by the distance matrix, is the
        /// depot or a waypoint, or appears twice
        Route optimize(const std::vector<size_t> &nodes) const;

        /// @throws ConfigurationError if a node of the path is not covered by the distance matrix
        double path_distance(const std::vector<size_t> &path) const;
    };
}
