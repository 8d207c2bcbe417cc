#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "logger.hpp"
#include "route.hpp"

using namespace hfvrp;

namespace
{
    struct Expected
    {
        std::vector<size_t> nodes;
        double distance;
        std::vector<size_t> path;
    };

    void expect_well_formed(const Problem &problem, const Route &route)
    {
        ASSERT_GE(route.path.size(), 4u);
        EXPECT_EQ(route.path.front(), problem.depot);
        EXPECT_EQ(route.path.back(), problem.depot);
        EXPECT_EQ(std::count(route.path.begin(), route.path.end(), problem.waypoints.first), 1);
        EXPECT_EQ(std::count(route.path.begin(), route.path.end(), problem.waypoints.second), 1);
        EXPECT_EQ(std::count(route.path.begin(), route.path.end(), problem.depot), 2);
    }
}

TEST(RouteTest, ExhaustiveInsertionFindsOptimalPaths)
{
    auto problem = fixtures::scenario();
    RouteOptimizer optimizer(*problem);

    const std::vector<Expected> expected = {
        {{}, 61, {0, 4, 5, 0}},
        {{1}, 62, {0, 1, 4, 5, 0}},
        {{2}, 66, {0, 5, 4, 2, 0}},
        {{3}, 57, {0, 4, 5, 3, 0}},
        {{1, 2}, 67, {0, 1, 2, 4, 5, 0}},
        {{1, 3}, 58, {0, 1, 4, 5, 3, 0}},
        {{2, 3}, 62, {0, 3, 5, 4, 2, 0}},
        {{1, 2, 3}, 63, {0, 1, 2, 4, 5, 3, 0}},
    };

    for (const auto &e : expected)
    {
        auto route = optimizer.optimize(e.nodes);
        SCOPED_TRACE(format_nodes(e.nodes));
        EXPECT_DOUBLE_EQ(route.distance, e.distance);
        EXPECT_EQ(route.path, e.path);
        EXPECT_DOUBLE_EQ(optimizer.path_distance(route.path), route.distance);
        expect_well_formed(*problem, route);
    }
}

TEST(RouteTest, AppendNearestKeepsWaypointsAtTheTail)
{
    auto problem = fixtures::scenario();
    RouteOptimizer optimizer(*problem, TailStrategy::append_nearest);

    auto route = optimizer.optimize({1, 2, 3});
    EXPECT_DOUBLE_EQ(route.distance, 71.0);
    EXPECT_EQ(route.path, (std::vector<size_t>{0, 1, 2, 3, 5, 4, 0}));
    EXPECT_EQ(route.order, (std::vector<size_t>{1, 2, 3}));
    expect_well_formed(*problem, route);
}

TEST(RouteTest, AppendNearestNeverBeatsExhaustiveInsertion)
{
    auto problem = fixtures::scenario();
    RouteOptimizer exhaustive(*problem);
    RouteOptimizer append(*problem, TailStrategy::append_nearest);

    const std::vector<std::vector<size_t>> subsets = {{}, {1}, {2}, {3}, {1, 2}, {1, 3}, {2, 3}, {1, 2, 3}};
    for (const auto &nodes : subsets)
    {
        EXPECT_LE(exhaustive.optimize(nodes).distance, append.optimize(nodes).distance) << format_nodes(nodes);
    }

    // Waypoint 4 sits close to node 1, so visiting it mid-route pays off
    EXPECT_DOUBLE_EQ(exhaustive.optimize({1, 3}).distance, 58.0);
    EXPECT_DOUBLE_EQ(append.optimize({1, 3}).distance, 67.0);
}

TEST(RouteTest, EmptyTripPicksCheaperWaypointOrder)
{
    auto problem = fixtures::scenario();
    problem->distance_matrix[0][4] = 40;

    // 0 -> 5 -> 4 -> 0 = 30 + 6 + 25 beats 0 -> 4 -> 5 -> 0 = 40 + 6 + 30
    for (auto strategy : {TailStrategy::exhaustive_insertion, TailStrategy::append_nearest})
    {
        auto route = RouteOptimizer(*problem, strategy).optimize({});
        EXPECT_DOUBLE_EQ(route.distance, 61.0);
        EXPECT_EQ(route.path, (std::vector<size_t>{0, 5, 4, 0}));
        EXPECT_TRUE(route.order.empty());
    }
}

TEST(RouteTest, IsDeterministicAndOrderIndependent)
{
    auto problem = fixtures::scenario();
    RouteOptimizer optimizer(*problem);

    auto first = optimizer.optimize({3, 1, 2});
    auto second = optimizer.optimize({1, 2, 3});
    EXPECT_EQ(first.path, second.path);
    EXPECT_EQ(first.order, second.order);
    EXPECT_DOUBLE_EQ(first.distance, second.distance);
}

TEST(RouteTest, RejectsNodesOutsideTheMatrix)
{
    auto problem = fixtures::scenario();
    RouteOptimizer optimizer(*problem);

    EXPECT_THROW(optimizer.optimize({1, 6}), ConfigurationError);
    EXPECT_THROW(optimizer.path_distance({0, 7, 0}), ConfigurationError);
}

TEST(RouteTest, RejectsDepotWaypointsAndDuplicates)
{
    auto problem = fixtures::scenario();
    RouteOptimizer optimizer(*problem);

    EXPECT_THROW(optimizer.optimize({0, 1}), ConfigurationError);
    EXPECT_THROW(optimizer.optimize({4}), ConfigurationError);
    EXPECT_THROW(optimizer.optimize({2, 2}), ConfigurationError);
}

TEST(RouteTest, ParsesStrategyNames)
{
    EXPECT_EQ(parse_tail_strategy("exhaustive-insertion"), TailStrategy::exhaustive_insertion);
    EXPECT_EQ(parse_tail_strategy("append"), TailStrategy::append_nearest);
    EXPECT_STREQ(to_string(TailStrategy::append_nearest), "append-nearest");
    EXPECT_THROW(parse_tail_strategy("nearest"), std::invalid_argument);
}
