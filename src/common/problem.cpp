#include "problem.hpp"

namespace hfvrp
{
    namespace
    {
        void _expect(std::istream &input, const std::string &keyword, const std::filesystem::path &path)
        {
            std::string token;
            if (!(input >> token) || token != keyword)
            {
                throw ConfigurationError(fmt::format("{}: expected \"{}\" but found \"{}\"", path.string(), keyword, token));
            }
        }

        template <typename T>
        T _read(std::istream &input, const char *what, const std::filesystem::path &path)
        {
            T value;
            if (!(input >> value))
            {
                throw ConfigurationError(fmt::format("{}: unable to read {}", path.string(), what));
            }
            return value;
        }
    }

    Problem::Problem(
        std::string &&name,
        std::vector<std::vector<double>> &&distance_matrix,
        std::map<size_t, Load> &&demands,
        std::vector<Vehicle> &&vehicles,
        size_t depot,
        std::pair<size_t, size_t> waypoints)
        : name(std::move(name)),
          distance_matrix(std::move(distance_matrix)),
          demands(std::move(demands)),
          vehicles(std::move(vehicles)),
          depot(depot),
          waypoints(waypoints)
    {
        auto n = this->distance_matrix.size();
        for (size_t i = 0; i < n; i++)
        {
            if (this->distance_matrix[i].size() != n)
            {
                throw ConfigurationError(fmt::format("Distance matrix row {} has {} entries, expected {}", i, this->distance_matrix[i].size(), n));
            }

            for (size_t j = 0; j < n; j++)
            {
                auto d = this->distance_matrix[i][j];
                if (!(d >= 0.0) || !std::isfinite(d))
                {
                    throw ConfigurationError(fmt::format("Invalid distance {} from {} to {}", d, i, j));
                }
            }

            if (this->distance_matrix[i][i] != 0.0)
            {
                throw ConfigurationError(fmt::format("Self distance of node {} is {}, expected 0", i, this->distance_matrix[i][i]));
            }
        }

        for (auto node : {depot, waypoints.first, waypoints.second})
        {
            if (!contains(node))
            {
                throw ConfigurationError(fmt::format("Node {} is not covered by the {}x{} distance matrix", node, n, n));
            }
        }

        if (depot == waypoints.first || depot == waypoints.second || waypoints.first == waypoints.second)
        {
            throw ConfigurationError(fmt::format("Depot {} and waypoints {}, {} must be distinct", depot, waypoints.first, waypoints.second));
        }

        for (const auto &[node, _] : this->demands)
        {
            if (!contains(node))
            {
                throw ConfigurationError(fmt::format("Delivery node {} is not covered by the {}x{} distance matrix", node, n, n));
            }

            if (node == depot || node == waypoints.first || node == waypoints.second)
            {
                throw ConfigurationError(fmt::format("Node {} is the depot or a waypoint and cannot carry a demand", node));
            }
        }

        std::set<std::string> names;
        for (const auto &vehicle : this->vehicles)
        {
            if (!names.insert(vehicle.name).second)
            {
                throw ConfigurationError(fmt::format("Vehicle name {} is not unique", vehicle.name));
            }

            if (vehicle.fixed_cost < 0.0 || vehicle.fuel_cost < 0.0)
            {
                throw ConfigurationError(fmt::format("Vehicle {} has a negative cost", vehicle.name));
            }
        }
    }

    std::unique_ptr<Problem> Problem::from_file(const std::filesystem::path &path)
    {
        std::ifstream input(path);
        if (!input.is_open())
        {
            throw std::runtime_error(fmt::format("Unable to open {}", path.string()));
        }

        _expect(input, "NAME", path);
        auto name = _read<std::string>(input, "instance name", path);

        _expect(input, "DEPOT", path);
        auto depot = _read<size_t>(input, "depot id", path);

        _expect(input, "WAYPOINTS", path);
        auto first = _read<size_t>(input, "first waypoint", path);
        auto second = _read<size_t>(input, "second waypoint", path);

        _expect(input, "DISTANCES", path);
        auto n = _read<size_t>(input, "matrix dimension", path);
        std::vector<std::vector<double>> distance_matrix(n, std::vector<double>(n));
        for (size_t i = 0; i < n; i++)
        {
            for (size_t j = 0; j < n; j++)
            {
                distance_matrix[i][j] = _read<double>(input, "distance", path);
            }
        }

        _expect(input, "DEMANDS", path);
        auto demands_count = _read<size_t>(input, "demand count", path);
        std::map<size_t, Load> demands;
        for (size_t i = 0; i < demands_count; i++)
        {
            auto node = _read<size_t>(input, "delivery node", path);
            auto h = _read<uint64_t>(input, "h demand", path);
            auto k = _read<uint64_t>(input, "k demand", path);
            if (!demands.emplace(node, Load{h, k}).second)
            {
                throw ConfigurationError(fmt::format("{}: duplicate demand for node {}", path.string(), node));
            }
        }

        _expect(input, "VEHICLES", path);
        auto vehicles_count = _read<size_t>(input, "vehicle count", path);
        std::vector<Vehicle> vehicles;
        vehicles.reserve(vehicles_count);
        for (size_t i = 0; i < vehicles_count; i++)
        {
            auto vehicle_name = _read<std::string>(input, "vehicle name", path);
            auto fixed_cost = _read<double>(input, "fixed cost", path);
            auto h = _read<uint64_t>(input, "h capacity", path);
            auto k = _read<uint64_t>(input, "k capacity", path);
            auto fuel_cost = _read<double>(input, "fuel cost", path);
            vehicles.emplace_back(std::move(vehicle_name), fixed_cost, Load{h, k}, fuel_cost);
        }

        return std::make_unique<Problem>(
            std::move(name),
            std::move(distance_matrix),
            std::move(demands),
            std::move(vehicles),
            depot,
            std::make_pair(first, second));
    }

    double Problem::distance(size_t from, size_t to) const
    {
        if (!contains(from) || !contains(to))
        {
            throw ConfigurationError(fmt::format("No distance from {} to {} in the {}x{} distance matrix", from, to, nodes_count(), nodes_count()));
        }

        return distance_matrix[from][to];
    }

    const Load &Problem::demand(size_t node) const
    {
        auto iter = demands.find(node);
        if (iter == demands.end())
        {
            throw ConfigurationError(fmt::format("Node {} has no entry in the demand table", node));
        }

        return iter->second;
    }

    std::vector<size_t> Problem::delivery_nodes() const
    {
        std::vector<size_t> result;
        result.reserve(demands.size());
        for (const auto &[node, _] : demands)
        {
            result.push_back(node);
        }
        return result;
    }

    double Problem::min_incoming_distance() const
    {
        auto result = std::numeric_limits<double>::infinity();
        for (const auto &[node, _] : demands)
        {
            for (size_t from = 0; from < nodes_count(); from++)
            {
                if (from != node)
                {
                    result = std::min(result, distance_matrix[from][node]);
                }
            }
        }

        return std::isfinite(result) ? result : 0.0;
    }

    const Vehicle *Problem::find_vehicle(const std::string &name) const noexcept
    {
        for (const auto &vehicle : vehicles)
        {
            if (vehicle.name == name)
            {
                return &vehicle;
            }
        }

        return nullptr;
    }
}
