#include "gtest/gtest.h"

#include <memory>
#include <stdexcept>
#include "NetworkGraph.hpp"
#include "ShortestPathEngine.hpp"
#include "TestNetwork.hpp"

namespace
{
struct HopCount : EdgeCostModel
{
    double cost(EdgeStep const&) const override { return 1.0; }
};

struct Negative : EdgeCostModel
{
    double cost(EdgeStep const&) const override { return -1.0; }
};

class ShortestPathEngineTest : public ::testing::Test
{
protected:
    NetworkGraph graph{testLines(), testTransfers()};
    ShortestPathEngine engine{graph};
    std::shared_ptr<CrimeMap const> crime =
        std::make_shared<CrimeMap const>(CrimeMap{{"Gamma", 20}, {"Kappa", 0}});
};
}

TEST_F(ShortestPathEngineTest, same_station_is_a_trivial_route)
{
    auto route = engine.findPath("Gamma", "Gamma", WeightPolicy::fast());

    ASSERT_TRUE(route);
    EXPECT_EQ((std::vector<std::string>{"Gamma"}), route->stations);
    EXPECT_TRUE(route->lines.empty());
    EXPECT_TRUE(route->path.empty());
    EXPECT_TRUE(route->segments.empty());
    EXPECT_EQ(1, route->totalStops);
    EXPECT_EQ(0, route->totalTimeMinutes);
    EXPECT_EQ(0, route->totalTransfers);
    EXPECT_EQ(0.0, engine.pathCost(*route, WeightPolicy::fast()));
}

TEST_F(ShortestPathEngineTest, unknown_station_yields_nothing)
{
    EXPECT_FALSE(engine.findPath("Nowhere", "Gamma", WeightPolicy::fast()));
    EXPECT_FALSE(engine.findPath("Gamma", "Nowhere", WeightPolicy::fast()));
}

TEST_F(ShortestPathEngineTest, direct_ride)
{
    auto route = engine.findPath("Alpha", "Delta", WeightPolicy::fast());

    ASSERT_TRUE(route);
    EXPECT_EQ((std::vector<std::string>{"Alpha", "Beta", "Gamma", "Delta"}), route->stations);
    EXPECT_EQ((std::vector<std::string>{"A"}), route->lines);
    EXPECT_EQ(0, route->totalTransfers);
    EXPECT_EQ(4, route->totalStops);
    EXPECT_EQ(6, route->totalTimeMinutes);
    EXPECT_DOUBLE_EQ(6.0, route->weightedCost);

    ASSERT_EQ(1u, route->segments.size());
    auto const& ride = route->segments.front();
    EXPECT_EQ(SegmentType::Ride, ride.type);
    EXPECT_EQ("A", ride.line);
    EXPECT_EQ("Alpha", ride.fromStation);
    EXPECT_EQ("Delta", ride.toStation);
    EXPECT_EQ(3, ride.stopCount);
    EXPECT_EQ(6, ride.minutes);
}

TEST_F(ShortestPathEngineTest, ride_transfer_ride)
{
    auto route = engine.findPath("Alpha", "Kappa", WeightPolicy::fast());

    ASSERT_TRUE(route);
    EXPECT_EQ((std::vector<std::string>{"Alpha", "Beta", "Beta", "Kappa"}), route->stations);
    EXPECT_EQ((std::vector<std::string>{"A", "B"}), route->lines);
    EXPECT_EQ(1, route->totalTransfers);
    EXPECT_EQ(5, route->totalTimeMinutes);
    EXPECT_DOUBLE_EQ(13.0, route->weightedCost);

    ASSERT_EQ(3u, route->segments.size());
    EXPECT_EQ(SegmentType::Ride, route->segments[0].type);
    EXPECT_EQ(1, route->segments[0].stopCount);
    EXPECT_EQ(SegmentType::Transfer, route->segments[1].type);
    EXPECT_EQ("Beta", route->segments[1].station);
    EXPECT_EQ("A", route->segments[1].fromLine);
    EXPECT_EQ("B", route->segments[1].toLine);
    EXPECT_EQ(2, route->segments[1].minutes);
    EXPECT_EQ(SegmentType::Ride, route->segments[2].type);
    EXPECT_EQ("Beta", route->segments[2].fromStation);
    EXPECT_EQ("Kappa", route->segments[2].toStation);
}

TEST_F(ShortestPathEngineTest, transfer_ceiling_blocks_expansion)
{
    EXPECT_FALSE(engine.findPath("Alpha", "Kappa", WeightPolicy::fast(), 0));
    EXPECT_TRUE(engine.findPath("Alpha", "Kappa", WeightPolicy::fast(), 1));
}

TEST_F(ShortestPathEngineTest, starts_on_every_line_at_origin)
{
    auto route = engine.findPath("Beta", "Delta", WeightPolicy::safe(crime));

    ASSERT_TRUE(route);
    EXPECT_EQ((std::vector<std::string>{"Beta", "Kappa", "Delta"}), route->stations);
    EXPECT_EQ(0, route->totalTransfers);
    EXPECT_DOUBLE_EQ(5.0, route->weightedCost);
}

TEST_F(ShortestPathEngineTest, equal_cost_prefers_earlier_line)
{
    auto route = engine.findPath("Beta", "Delta", WeightPolicy::fast());

    ASSERT_TRUE(route);
    EXPECT_EQ((std::vector<std::string>{"A"}), route->lines);
    EXPECT_EQ((std::vector<std::string>{"Beta", "Gamma", "Delta"}), route->stations);
}

TEST_F(ShortestPathEngineTest, path_cost_matches_search_cost)
{
    auto const policy = WeightPolicy::balanced(crime);
    auto route = engine.findPath("Alpha", "Zeta", policy);

    ASSERT_TRUE(route);
    auto cost = engine.pathCost(*route, policy);
    ASSERT_TRUE(cost);
    EXPECT_NEAR(route->weightedCost, *cost, 1e-9);
}

TEST_F(ShortestPathEngineTest, custom_policy)
{
    auto route = engine.findPath("Zeta", "Kappa", WeightPolicy::custom(std::make_shared<HopCount>()));

    ASSERT_TRUE(route);
    EXPECT_DOUBLE_EQ(4.0, route->weightedCost);
    EXPECT_EQ((std::vector<std::string>{"Zeta", "Epsilon", "Delta", "Delta", "Kappa"}), route->stations);
}

TEST_F(ShortestPathEngineTest, negative_cost_is_rejected)
{
    EXPECT_THROW(engine.findPath("Alpha", "Delta", WeightPolicy::custom(std::make_shared<Negative>())),
                 std::domain_error);
}
