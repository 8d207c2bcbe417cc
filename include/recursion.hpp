#pragma once

#include "logger.hpp"
#include "solution.hpp"

namespace hfvrp
{
    struct SearchConfig
    {
        /// @brief A branch is abandoned once its cost bound exceeds the best known total cost by
        /// more than this fraction. Zero keeps only the bound itself.
        double pruning_tolerance = 0.1;

        /// @brief Distance every still unassigned delivery is assumed to add at least. Defaults to
        /// Problem::min_incoming_distance(), which keeps the bound a true lower bound; a larger
        /// fixed value prunes harder but may cut off the optimum.
        std::optional<double> min_node_distance;

        /// @brief Weight of the fuel rate in the cost estimate that orders vehicles by efficiency.
        double fuel_weight = 10.0;

        TailStrategy tail_strategy = TailStrategy::exhaustive_insertion;

        /// @brief Stop after this many recursive calls and return the best solution so far.
        std::optional<uint64_t> call_limit;

        std::optional<std::chrono::milliseconds> time_limit;
    };

    struct SearchStats
    {
        uint64_t calls = 0;
        uint64_t pruned = 0;
        uint64_t capacity_rejections = 0;
        uint64_t complete_solutions = 0;
        uint64_t improvements = 0;
        bool aborted = false;
    };

    /// @brief Depth-first branch and bound over the ways of splitting the deliveries across
    /// vehicles, each used at most once.
    ///
    /// The partial assignment lives in `_trips`/`_used` and is pushed before every recursive
    /// call and popped right after it, so a branch never sees state left over from a sibling.
    class PartitionSearch
    {
    protected:
        const Problem &_problem;
        SearchConfig _config;
        Logger _logger;
        RouteOptimizer _optimizer;
        double _min_node_distance;

        std::vector<size_t> _vehicles;
        std::vector<bool> _used;
        std::vector<Trip> _trips;
        std::map<std::vector<size_t>, Route> _routes;

        Solution _best;
        SearchStats _stats;
        std::chrono::steady_clock::time_point _timer;

        void _solve(const std::vector<size_t> &unassigned, size_t depth);
        void _evaluate(size_t depth);
        bool _should_prune(const std::vector<size_t> &unassigned, size_t depth);
        bool _out_of_budget();

        const Route &_route(const std::vector<size_t> &nodes);
        void _push(size_t vehicle, const std::vector<size_t> &nodes, const Route &route);
        void _pop(size_t vehicle);

    public:
        explicit PartitionSearch(const Problem &problem, SearchConfig config = {}, Logger logger = Logger());

        /// @brief Capacity-to-cost ratio used to try the most efficient vehicles first.
        static double efficiency(const Vehicle &vehicle, double fuel_weight) noexcept;

        /// @brief Vehicle indices from `vehicles`, most efficient first, ties in input order.
        std::vector<size_t> vehicle_order(const std::vector<size_t> &vehicles) const;

        /// @brief Best assignment of every delivery node using any vehicle of the problem.
        Solution solve();

        /// @brief Best assignment of `nodes` using only the vehicles listed in `vehicles`.
        ///
        /// Returns an incomplete solution when no covering assignment was found, which is
        /// conclusive only when `pruning_tolerance` is zero and no budget was hit.
        ///
        /// @throws ConfigurationError on nodes without demand or unknown/duplicate vehicles
        Solution solve(const std::vector<size_t> &nodes, const std::vector<size_t> &vehicles);

        inline const SearchStats &stats() const noexcept
        {
            return _stats;
        }

        inline std::chrono::milliseconds elapsed() const
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - _timer);
        }

        inline const SearchConfig &config() const noexcept
        {
            return _config;
        }
    };
}
