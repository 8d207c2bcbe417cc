#pragma once

#include "problem.hpp"

namespace hfvrp::fixtures
{
    /// Depot 0, deliveries 1..3, waypoints 4 and 5; vehicle V (150, 2/2) and W (200, 3/3).
    inline std::unique_ptr<Problem> scenario(std::map<size_t, Load> demands = {{1, {1, 0}}, {2, {1, 2}}, {3, {0, 2}}})
    {
        std::vector<std::vector<double>> distances = {
            {0, 12, 21, 18, 25, 30},
            {12, 0, 9, 16, 14, 21},
            {20, 9, 0, 11, 10, 17},
            {18, 16, 11, 0, 13, 8},
            {25, 14, 10, 13, 0, 6},
            {30, 21, 17, 8, 6, 0},
        };

        std::vector<Vehicle> vehicles;
        vehicles.emplace_back("V", 150.0, Load{2, 2}, 1.0);
        vehicles.emplace_back("W", 200.0, Load{3, 3}, 1.0);

        return std::make_unique<Problem>(
            "scenario", std::move(distances), std::move(demands), std::move(vehicles), 0, std::make_pair(size_t(4), size_t(5)));
    }

    inline std::filesystem::path data_file(const char *name)
    {
        return std::filesystem::path(HFVRP_DATA_DIR) / name;
    }
}
