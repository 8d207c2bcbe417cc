#include "cli.hpp"

namespace hfvrp
{
    namespace
    {
        const char *USAGE =
            "Usage: {} <problem_file> [--verify] [--analyze] [--quiet] [--verbose <level>]\n"
            "       [--tolerance <fraction>] [--min-distance <distance>] [--fuel-weight <weight>]\n"
            "       [--tail exhaustive-insertion|append-nearest] [--vehicles <name,...>]\n"
            "       [--call-limit <calls>] [--time-limit <ms>]";

        std::vector<std::string> _split(const std::string &list)
        {
            std::vector<std::string> result;
            std::stringstream stream(list);
            std::string item;
            while (std::getline(stream, item, ','))
            {
                if (!item.empty())
                {
                    result.push_back(item);
                }
            }
            return result;
        }
    }

    Arguments Arguments::parse(int argc, char **argv)
    {
        if (argc < 2)
        {
            throw std::runtime_error(fmt::format(fmt::runtime(USAGE), argv[0]));
        }

        Arguments arguments;

        auto value = [&](int &i)
        {
            if (i + 1 >= argc)
            {
                throw std::runtime_error(fmt::format("Missing value after {}", argv[i]));
            }
            return std::string(argv[++i]);
        };

        std::optional<std::string> path;
        for (int i = 1; i < argc; i++)
        {
            std::string arg(argv[i]);
            if (arg == "--verify")
            {
                arguments.verify = true;
            }
            else if (arg == "--analyze")
            {
                arguments.analyze = true;
            }
            else if (arg == "--quiet")
            {
                arguments.verbosity = -1;
            }
            else if (arg == "--verbose")
            {
                arguments.verbosity = std::stoi(value(i));
            }
            else if (arg == "--tolerance")
            {
                arguments.config.pruning_tolerance = std::stod(value(i));
            }
            else if (arg == "--min-distance")
            {
                arguments.config.min_node_distance = std::stod(value(i));
            }
            else if (arg == "--fuel-weight")
            {
                arguments.config.fuel_weight = std::stod(value(i));
            }
            else if (arg == "--tail")
            {
                arguments.config.tail_strategy = parse_tail_strategy(value(i));
            }
            else if (arg == "--vehicles")
            {
                arguments.vehicles = _split(value(i));
            }
            else if (arg == "--call-limit")
            {
                arguments.config.call_limit = std::stoull(value(i));
            }
            else if (arg == "--time-limit")
            {
                arguments.config.time_limit = std::chrono::milliseconds(std::stoll(value(i)));
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error(fmt::format("Unknown option {}\n{}", arg, fmt::format(fmt::runtime(USAGE), argv[0])));
            }
            else if (path.has_value())
            {
                throw std::runtime_error(fmt::format("Unexpected argument {}", arg));
            }
            else
            {
                path = arg;
            }
        }

        if (!path.has_value())
        {
            throw std::runtime_error(fmt::format(fmt::runtime(USAGE), argv[0]));
        }

        arguments.problem = Problem::from_file(*path);
        return arguments;
    }

    std::vector<size_t> Arguments::vehicle_indices() const
    {
        std::vector<size_t> result;
        if (vehicles.empty())
        {
            result.resize(problem->vehicles_count());
            std::iota(result.begin(), result.end(), 0);
            return result;
        }

        for (const auto &name : vehicles)
        {
            auto vehicle = problem->find_vehicle(name);
            if (vehicle == nullptr)
            {
                throw ConfigurationError(fmt::format("Unknown vehicle {}", name));
            }
            result.push_back(static_cast<size_t>(vehicle - problem->vehicles.data()));
        }
        return result;
    }
}
