#include "cli.hpp"
#include "display.hpp"

int main(int argc, char **argv)
{
    try
    {
        auto arguments = hfvrp::Arguments::parse(argc, argv);
        const auto &problem = *arguments.problem;
        hfvrp::Logger logger(&std::cerr, arguments.verbosity);
        logger.log(0, "{} loaded {} with {} nodes, {} deliveries and {} vehicles",
                   argv[0], problem.name, problem.nodes_count(), problem.customers_count(), problem.vehicles_count());

        auto vehicles = arguments.vehicle_indices();
        hfvrp::PartitionSearch search(problem, arguments.config, logger);
        auto solution = search.solve(problem.delivery_nodes(), vehicles);

        const auto &stats = search.stats();
        logger.log(0, "Search finished in {} ms: {} calls, {} pruned, {} complete solutions{}",
                   search.elapsed().count(), stats.calls, stats.pruned, stats.complete_solutions,
                   stats.aborted ? " (budget exhausted)" : "");

        hfvrp::print_solution(std::cout, problem, solution);
        if (!solution.completed())
        {
            return 2;
        }

        auto report = hfvrp::validate(problem, solution);
        hfvrp::print_validation(std::cout, report);

        if (arguments.analyze && report.valid())
        {
            hfvrp::print_analysis(std::cout, hfvrp::analyze(problem, solution));
        }

        if (arguments.verify)
        {
            hfvrp::SetPartitionVerifier verifier(problem, arguments.config.tail_strategy, logger);
            auto verified = verifier.solve(vehicles);
            if (!verified.has_value())
            {
                std::cout << "The set-partition verifier found no feasible cover" << std::endl;
            }
            else
            {
                hfvrp::print_comparison(std::cout, hfvrp::to_verified(problem, solution), *verified);
            }
        }

        return report.valid() ? 0 : 3;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
