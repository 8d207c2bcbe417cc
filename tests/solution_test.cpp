#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "solution.hpp"

using namespace hfvrp;

namespace
{
    Trip make_trip(const Problem &problem, size_t vehicle, std::vector<size_t> nodes)
    {
        auto route = RouteOptimizer(problem).optimize(nodes);
        return Trip(vehicle, std::move(nodes), std::move(route));
    }
}

TEST(SolutionTest, AggregatesTrips)
{
    auto problem = fixtures::scenario();
    std::vector<Trip> trips;
    trips.push_back(make_trip(*problem, 1, {1, 2}));
    trips.push_back(make_trip(*problem, 0, {3}));

    auto solution = Solution::from_trips(*problem, std::move(trips));
    EXPECT_TRUE(solution.completed());
    EXPECT_DOUBLE_EQ(solution.fixed_cost(), 350.0);
    EXPECT_DOUBLE_EQ(solution.fuel_cost(), 124.0);
    EXPECT_DOUBLE_EQ(solution.total_cost(), 474.0);
    EXPECT_DOUBLE_EQ(solution.total_distance(), 124.0);
    EXPECT_EQ(solution.vehicles_used(), 2u);
}

TEST(SolutionTest, IncompleteLosesToAnyCompleted)
{
    auto problem = fixtures::scenario();
    std::vector<Trip> trips;
    trips.push_back(make_trip(*problem, 1, {1, 2, 3}));
    auto expensive = Solution::from_trips(*problem, std::move(trips));

    auto incomplete = Solution::incomplete();
    EXPECT_FALSE(incomplete.completed());
    EXPECT_TRUE(expensive.is_better_than(incomplete));
    EXPECT_FALSE(incomplete.is_better_than(expensive));
    EXPECT_EQ(compare(incomplete, Solution::incomplete()), std::weak_ordering::equivalent);
}

TEST(SolutionTest, CostDecidesFirst)
{
    auto problem = fixtures::scenario();

    std::vector<Trip> cheap, dear;
    cheap.push_back(make_trip(*problem, 1, {1, 2, 3}));
    dear.push_back(make_trip(*problem, 1, {1, 2}));
    dear.push_back(make_trip(*problem, 0, {3}));

    auto a = Solution::from_trips(*problem, std::move(cheap));
    auto b = Solution::from_trips(*problem, std::move(dear));
    ASSERT_LT(a.total_cost(), b.total_cost());
    EXPECT_EQ(compare(a, b), std::weak_ordering::less);
    EXPECT_EQ(compare(b, a), std::weak_ordering::greater);
}

TEST(SolutionTest, FewerVehiclesBreakCostTies)
{
    std::vector<std::vector<double>> distances = {
        {0, 1, 1, 1, 1},
        {1, 0, 1, 1, 1},
        {1, 1, 0, 1, 1},
        {1, 1, 1, 0, 1},
        {1, 1, 1, 1, 0},
    };
    std::vector<Vehicle> vehicles;
    vehicles.emplace_back("free", 0.0, Load{9, 9}, 0.0);
    vehicles.emplace_back("also-free", 0.0, Load{9, 9}, 0.0);
    Problem problem("ties", std::move(distances), {{1, {1, 1}}, {2, {1, 1}}}, std::move(vehicles), 0, std::make_pair(size_t(3), size_t(4)));

    std::vector<Trip> one, two;
    one.push_back(make_trip(problem, 0, {1, 2}));
    two.push_back(make_trip(problem, 0, {1}));
    two.push_back(make_trip(problem, 1, {2}));

    auto a = Solution::from_trips(problem, std::move(one));
    auto b = Solution::from_trips(problem, std::move(two));
    ASSERT_DOUBLE_EQ(a.total_cost(), b.total_cost());
    EXPECT_TRUE(a.is_better_than(b));
    EXPECT_FALSE(b.is_better_than(a));
}

TEST(SolutionTest, ShorterDistanceBreaksRemainingTies)
{
    std::vector<std::vector<double>> distances = {
        {0, 1, 5, 1, 1},
        {1, 0, 5, 1, 1},
        {5, 5, 0, 5, 5},
        {1, 1, 5, 0, 1},
        {1, 1, 5, 1, 0},
    };
    std::vector<Vehicle> vehicles;
    vehicles.emplace_back("walker", 10.0, Load{9, 9}, 0.0);
    Problem problem("ties", std::move(distances), {{1, {1, 1}}, {2, {1, 1}}}, std::move(vehicles), 0, std::make_pair(size_t(3), size_t(4)));

    std::vector<Trip> near, far;
    near.push_back(make_trip(problem, 0, {1}));
    far.push_back(make_trip(problem, 0, {2}));

    auto a = Solution::from_trips(problem, std::move(near));
    auto b = Solution::from_trips(problem, std::move(far));
    ASSERT_DOUBLE_EQ(a.total_cost(), b.total_cost());
    ASSERT_EQ(a.vehicles_used(), b.vehicles_used());
    EXPECT_LT(a.total_distance(), b.total_distance());
    EXPECT_EQ(compare(a, b), std::weak_ordering::less);
    EXPECT_EQ(compare(a, a), std::weak_ordering::equivalent);
}
