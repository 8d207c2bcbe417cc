#pragma once

#include "errors.hpp"

namespace hfvrp
{
    /// @brief Two independent goods dimensions, used both for delivery demands and vehicle capacities.
    struct Load
    {
        uint64_t h;
        uint64_t k;

        Load &operator+=(const Load &other) noexcept
        {
            h += other.h;
            k += other.k;
            return *this;
        }

        inline bool fits_within(const Load &capacity) const noexcept
        {
            return h <= capacity.h && k <= capacity.k;
        }

        bool operator==(const Load &other) const noexcept = default;
    };

    struct Vehicle
    {
        std::string name;
        double fixed_cost;
        Load capacity;
        double fuel_cost;

        explicit Vehicle(std::string name, double fixed_cost, Load capacity, double fuel_cost)
            : name(std::move(name)), fixed_cost(fixed_cost), capacity(capacity), fuel_cost(fuel_cost) {}
    };

    class Problem
    {
    public:
        std::string name;
        std::vector<std::vector<double>> distance_matrix;
        std::map<size_t, Load> demands;
        std::vector<Vehicle> vehicles;
        size_t depot;
        std::pair<size_t, size_t> waypoints;

        /// @brief Takes ownership of the input tables and checks that they are consistent.
        /// @throws ConfigurationError if the matrix is not square, holds negative or non-zero
        /// self distances, or if the depot, a waypoint or a delivery node lies outside of it.
        explicit Problem(
            std::string &&name,
            std::vector<std::vector<double>> &&distance_matrix,
            std::map<size_t, Load> &&demands,
            std::vector<Vehicle> &&vehicles,
            size_t depot,
            std::pair<size_t, size_t> waypoints);

        static std::unique_ptr<Problem> from_file(const std::filesystem::path &path);

        inline size_t nodes_count() const noexcept
        {
            return distance_matrix.size();
        }

        inline size_t vehicles_count() const noexcept
        {
            return vehicles.size();
        }

        inline size_t customers_count() const noexcept
        {
            return demands.size();
        }

        inline bool contains(size_t node) const noexcept
        {
            return node < distance_matrix.size();
        }

        /// @throws ConfigurationError if either node is not covered by the distance matrix
        double distance(size_t from, size_t to) const;

        /// @throws ConfigurationError if the node has no entry in the demand table
        const Load &demand(size_t node) const;

        std::vector<size_t> delivery_nodes() const;

        /// @brief Shortest arc entering any delivery node from any other node. Every delivery node
        /// costs at least this much distance to reach, which makes it a safe per-node floor.
        double min_incoming_distance() const;

        const Vehicle *find_vehicle(const std::string &name) const noexcept;
    };
}
