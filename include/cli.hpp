#pragma once

#include "recursion.hpp"

namespace hfvrp
{
    struct Arguments
    {
        std::unique_ptr<Problem> problem;
        SearchConfig config;

        /// @brief Names of the only vehicles the search may use; empty means all of them.
        std::vector<std::string> vehicles;

        /// @brief -1 silences the log entirely, 0 keeps the headline messages.
        int verbosity = 0;
        bool verify = false;
        bool analyze = false;

        static Arguments parse(int argc, char **argv);

        /// @brief Indices of `vehicles` in the problem, or every vehicle if none were named.
        /// @throws ConfigurationError on a name the problem does not define
        std::vector<size_t> vehicle_indices() const;
    };
}
