#include "display.hpp"

namespace hfvrp
{
    namespace
    {
        const char *RULE = "=======================================";

        std::string _deliveries(const Problem &problem, const std::vector<size_t> &nodes)
        {
            std::string result;
            for (auto node : nodes)
            {
                const auto &load = problem.demand(node);
                if (!result.empty())
                {
                    result += ", ";
                }
                result += fmt::format("{} (H={}, K={})", node, load.h, load.k);
            }
            return result;
        }

        std::string _path(const std::vector<size_t> &path)
        {
            std::string result;
            for (auto node : path)
            {
                if (!result.empty())
                {
                    result += " -> ";
                }
                result += std::to_string(node);
            }
            return result;
        }
    }

    void print_solution(std::ostream &stream, const Problem &problem, const Solution &solution)
    {
        if (!solution.completed())
        {
            stream << "No solution found: the deliveries cannot be covered with the available vehicles" << std::endl;
            return;
        }

        size_t index = 0;
        for (const auto &trip : solution.trips())
        {
            stream << fmt::format("\nTrip #{} using vehicle {}\n", ++index, problem.vehicles[trip.vehicle].name);
            stream << fmt::format("  Deliveries: {}\n", _deliveries(problem, trip.nodes));
            stream << fmt::format("  Route     : {}\n", _path(trip.route.path));
            stream << fmt::format("  Distance  : {}\n", trip.route.distance);
            stream << fmt::format("  Fixed cost: {}\n", trip.fixed_cost(problem));
            stream << fmt::format("  Fuel cost : {}\n", trip.fuel_cost(problem));
            stream << fmt::format("  Total cost: {}\n", trip.cost(problem));
        }

        stream << '\n'
               << RULE << '\n';
        stream << fmt::format("Total fixed cost: {}\n", solution.fixed_cost());
        stream << fmt::format("Total fuel cost : {}\n", solution.fuel_cost());
        stream << fmt::format("Total cost      : {}\n", solution.total_cost());
        stream << fmt::format("Vehicles used   : {}\n", solution.vehicles_used());
        stream << fmt::format("Total distance  : {}\n", solution.total_distance());
        stream << RULE << std::endl;
    }

    void print_validation(std::ostream &stream, const ValidationReport &report)
    {
        if (report.valid())
        {
            stream << "Solution is valid: all checks passed" << std::endl;
            return;
        }

        stream << "Solution is INVALID:" << '\n';
        for (const auto &error : report.errors)
        {
            stream << "  - " << error << '\n';
        }
        stream << std::flush;
    }

    void print_analysis(std::ostream &stream, const SolutionAnalysis &analysis)
    {
        stream << "\nVehicle utilization:\n";
        for (const auto &trip : analysis.trips)
        {
            stream << fmt::format("  Vehicle {}: H={}/{} ({:.1f}%), K={}/{} ({:.1f}%), average {:.1f}%\n",
                                  trip.vehicle, trip.load.h, trip.capacity.h, trip.h_utilization,
                                  trip.load.k, trip.capacity.k, trip.k_utilization, trip.average_utilization());
        }

        stream << "\nDistance efficiency:\n";
        for (const auto &trip : analysis.trips)
        {
            stream << fmt::format("  Vehicle {}: actual {}, nearest-neighbour {:.1f}, ratio {:.2f}\n",
                                  trip.vehicle, trip.distance, trip.reference_distance, trip.efficiency_ratio());
        }
        stream << fmt::format("  Overall ratio: {:.2f}\n", analysis.efficiency_ratio);

        stream << "\nCost breakdown:\n";
        stream << fmt::format("  Fixed costs: {:.1f}% of total\n", analysis.fixed_cost_share);
        stream << fmt::format("  Fuel costs : {:.1f}% of total\n", analysis.fuel_cost_share);
        stream << fmt::format("  Overall capacity utilization: H={:.1f}%, K={:.1f}%\n", analysis.h_utilization, analysis.k_utilization);
        stream << std::flush;
    }

    void print_verified(std::ostream &stream, const char *title, const VerifiedSolution &solution)
    {
        stream << '\n'
               << title << ":\n";
        stream << fmt::format("  Total cost    : {}\n", solution.total_cost);
        stream << fmt::format("  Fixed cost    : {}\n", solution.fixed_cost());
        stream << fmt::format("  Fuel cost     : {}\n", solution.fuel_cost());
        stream << fmt::format("  Vehicles used : {}\n", solution.routes.size());
        stream << fmt::format("  Total distance: {}\n", solution.total_distance());

        size_t index = 0;
        for (const auto &route : solution.routes)
        {
            stream << fmt::format("  Route {}: vehicle {}, delivers to {}, path {}\n", ++index, route.vehicle, format_nodes(route.nodes), _path(route.path));
        }
        stream << std::flush;
    }

    void print_comparison(std::ostream &stream, const VerifiedSolution &search, const VerifiedSolution &verifier)
    {
        print_verified(stream, "Partition search", search);
        print_verified(stream, "Set-partition verifier", verifier);

        auto comparison = compare_solutions(search, verifier);
        stream << "\nDifferences (search - verifier):\n";
        stream << fmt::format("  Cost    : {}\n", comparison.cost_difference);
        stream << fmt::format("  Vehicles: {}\n", comparison.vehicle_difference);
        stream << fmt::format("  Distance: {}\n", comparison.distance_difference);

        if (comparison.agree())
        {
            stream << "Verification successful: both methods found the same optimum" << std::endl;
        }
        else if (std::abs(comparison.cost_difference) < 1.0e-6)
        {
            stream << fmt::format("Same cost but {} vehicles apart", comparison.vehicle_difference) << std::endl;
        }
        else if (comparison.cost_difference > 0.0)
        {
            stream << fmt::format("Partition search costs {} more than the verifier", comparison.cost_difference) << std::endl;
        }
        else
        {
            stream << fmt::format("Partition search costs {} less than the verifier", -comparison.cost_difference) << std::endl;
        }
    }
}
