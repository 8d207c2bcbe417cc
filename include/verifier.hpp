#pragma once

#include "logger.hpp"
#include "solution.hpp"

namespace hfvrp
{
    struct VerifiedRoute
    {
        std::string vehicle;
        std::vector<size_t> nodes;
        std::vector<size_t> path;
        double distance;
        double fixed_cost;
        double fuel_cost;
    };

    /// @brief Cross-check form shared by the partition search and the set-partition verifier.
    struct VerifiedSolution
    {
        double total_cost;
        std::vector<VerifiedRoute> routes;

        double fixed_cost() const noexcept;
        double fuel_cost() const noexcept;
        double total_distance() const noexcept;
    };

    VerifiedSolution to_verified(const Problem &problem, const Solution &solution);

    /// @brief Independent solver for the same tables, modelled as a set-partitioning MIP.
    ///
    /// Every (vehicle, node subset) pair that fits the vehicle becomes a boolean column priced at
    /// the vehicle's fixed cost plus fuel for the subset's optimal route. Each vehicle takes at
    /// most one column and each delivery is covered exactly once. The model is solved three times
    /// to honour the lexicographic objective: cost, then vehicles at that cost, then distance.
    class SetPartitionVerifier
    {
    public:
        static constexpr size_t MAX_NODES = 16;

    private:
        const Problem &_problem;
        TailStrategy _strategy;
        Logger _logger;
        std::string _backend;

    public:
        explicit SetPartitionVerifier(const Problem &problem, TailStrategy strategy = TailStrategy::exhaustive_insertion,
                                      Logger logger = Logger(), std::string backend = "SCIP")
            : _problem(problem), _strategy(strategy), _logger(logger), _backend(std::move(backend)) {}

        /// @brief Optimal cover of every delivery node with any vehicle, or std::nullopt if none exists.
        std::optional<VerifiedSolution> solve() const;

        /// @brief Optimal cover of every delivery node using only the listed vehicle indices.
        /// @throws ConfigurationError if the problem has more than MAX_NODES deliveries, on unknown
        /// or duplicate vehicles, or if the MIP backend is not available
        std::optional<VerifiedSolution> solve(const std::vector<size_t> &vehicles) const;
    };

    struct SolutionComparison
    {
        double cost_difference;
        long long vehicle_difference;
        double distance_difference;

        /// @brief Same total cost and vehicle count; routes may still differ on ties.
        bool agree() const noexcept;
    };

    /// @brief Differences of `a` minus `b`.
    SolutionComparison compare_solutions(const VerifiedSolution &a, const VerifiedSolution &b) noexcept;
}
