#include <gtest/gtest.h>

#include "display.hpp"
#include "fixtures.hpp"
#include "recursion.hpp"

using namespace hfvrp;

namespace
{
    bool contains(const std::string &text, const std::string &part)
    {
        return text.find(part) != std::string::npos;
    }
}

TEST(DisplayTest, PrintsTripsAndTotals)
{
    auto problem = fixtures::scenario();
    auto solution = PartitionSearch(*problem).solve();

    std::ostringstream stream;
    print_solution(stream, *problem, solution);
    auto text = stream.str();

    EXPECT_TRUE(contains(text, "Trip #1 using vehicle W")) << text;
    EXPECT_TRUE(contains(text, "Deliveries: 1 (H=1, K=0), 2 (H=1, K=2)")) << text;
    EXPECT_TRUE(contains(text, "Route     : 0 -> 1 -> 2 -> 4 -> 5 -> 0")) << text;
    EXPECT_TRUE(contains(text, "Trip #2 using vehicle V")) << text;
    EXPECT_TRUE(contains(text, "Total cost      : 474\n")) << text;
    EXPECT_TRUE(contains(text, "Vehicles used   : 2\n")) << text;
    EXPECT_TRUE(contains(text, "Total distance  : 124\n")) << text;
}

TEST(DisplayTest, PrintsMissingSolution)
{
    auto problem = fixtures::scenario();

    std::ostringstream stream;
    print_solution(stream, *problem, Solution::incomplete());
    EXPECT_TRUE(contains(stream.str(), "No solution found"));
}

TEST(DisplayTest, PrintsValidationVerdict)
{
    std::ostringstream valid;
    print_validation(valid, ValidationReport{});
    EXPECT_EQ(valid.str(), "Solution is valid: all checks passed\n");

    std::ostringstream invalid;
    print_validation(invalid, ValidationReport{{"Node 3 is not delivered"}});
    EXPECT_EQ(invalid.str(), "Solution is INVALID:\n  - Node 3 is not delivered\n");
}

TEST(DisplayTest, PrintsAnalysis)
{
    auto problem = fixtures::scenario();
    auto solution = PartitionSearch(*problem).solve();

    std::ostringstream stream;
    print_analysis(stream, analyze(*problem, solution));
    EXPECT_TRUE(contains(stream.str(), "Overall capacity utilization: H=40.0%, K=80.0%")) << stream.str();
}

TEST(DisplayTest, PrintsComparisonVerdicts)
{
    VerifiedSolution pair{474.0, {VerifiedRoute{"W", {1, 2}, {0, 1, 2, 4, 5, 0}, 67.0, 200.0, 67.0},
                                  VerifiedRoute{"V", {3}, {0, 4, 5, 3, 0}, 57.0, 150.0, 57.0}}};
    VerifiedSolution single{474.0, {VerifiedRoute{"Z", {1, 2, 3}, {0, 1, 2, 3, 4, 5, 0}, 74.0, 400.0, 74.0}}};
    VerifiedSolution dearer{500.0, pair.routes};

    std::ostringstream same;
    print_comparison(same, pair, pair);
    EXPECT_TRUE(contains(same.str(), "Verification successful: both methods found the same optimum")) << same.str();
    EXPECT_TRUE(contains(same.str(), "Route 1: vehicle W, delivers to [1,2], path 0 -> 1 -> 2 -> 4 -> 5 -> 0")) << same.str();

    std::ostringstream vehicles;
    print_comparison(vehicles, pair, single);
    EXPECT_TRUE(contains(vehicles.str(), "Same cost but 1 vehicles apart")) << vehicles.str();

    std::ostringstream more;
    print_comparison(more, dearer, pair);
    EXPECT_TRUE(contains(more.str(), "Partition search costs 26 more than the verifier")) << more.str();

    std::ostringstream less;
    print_comparison(less, pair, dearer);
    EXPECT_TRUE(contains(less.str(), "Partition search costs 26 less than the verifier")) << less.str();
}
