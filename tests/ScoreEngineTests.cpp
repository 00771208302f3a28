#include "gtest/gtest.h"

#include <cmath>
#include "ScoreEngine.hpp"

namespace
{
CrimeMap sampleCrime()
{
    return {{"S1", 0}, {"S2", 10}, {"S3", 20}, {"S4", 30}};
}

PerformanceMap samplePerformance()
{
    return {{"A", 80.0}, {"B", 85.0}, {"C", 90.0}, {"D", 95.0}};
}
}

TEST(ScoreEngine, baseline_statistics)
{
    auto stats = ScoreEngine::computeBaseline({4, 1, 3, 2}, ScoreEngine::kNeutralCrimeBaseline);

    EXPECT_DOUBLE_EQ(2.5, stats.mean);
    EXPECT_DOUBLE_EQ(2.5, stats.median);
    EXPECT_DOUBLE_EQ(std::sqrt(1.25), stats.stdDev);
    EXPECT_DOUBLE_EQ(1.0, stats.min);
    EXPECT_DOUBLE_EQ(4.0, stats.max);
    EXPECT_DOUBLE_EQ(2.0, stats.p25);
    EXPECT_DOUBLE_EQ(3.0, stats.p50);
    EXPECT_DOUBLE_EQ(4.0, stats.p75);
}

TEST(ScoreEngine, odd_count_median)
{
    auto stats = ScoreEngine::computeBaseline({7, 1, 3}, ScoreEngine::kNeutralCrimeBaseline);

    EXPECT_DOUBLE_EQ(3.0, stats.median);
    EXPECT_DOUBLE_EQ(1.0, stats.p25);
}

TEST(ScoreEngine, empty_data_uses_neutral_baselines)
{
    ScoreEngine engine(CrimeMap{}, PerformanceMap{});

    EXPECT_DOUBLE_EQ(5.0, engine.crimeBaseline().mean);
    EXPECT_DOUBLE_EQ(20.0, engine.crimeBaseline().max);
    EXPECT_DOUBLE_EQ(85.0, engine.reliabilityBaseline().mean);
    EXPECT_DOUBLE_EQ(77.0, engine.reliabilityBaseline().min);
}

TEST(ScoreEngine, safety_is_share_of_network_at_least_as_dangerous)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());

    EXPECT_EQ(10, engine.safetyScore({"S1"}));
    EXPECT_EQ(8, engine.safetyScore({"S2"}));
    EXPECT_EQ(6, engine.safetyScore({"S3"}));
    EXPECT_EQ(4, engine.safetyScore({"S4"}));
    EXPECT_EQ(6, engine.safetyScore({"S1", "S4"}));
}

TEST(ScoreEngine, unknown_station_counts_as_network_mean)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());

    EXPECT_EQ(6, engine.safetyScore({"Elsewhere"}));
}

TEST(ScoreEngine, safety_at_lower_quartile_lands_in_top_band)
{
    CrimeMap crime;
    for (unsigned int i = 0; i < 100; ++i)
        crime["S" + std::to_string(i)] = i;
    ScoreEngine engine(crime, PerformanceMap{});

    unsigned int const p25 = static_cast<unsigned int>(engine.crimeBaseline().p25);
    int const score = engine.safetyScore({"S" + std::to_string(p25)});

    EXPECT_GE(score, 8);
    EXPECT_LE(score, 9);
}

TEST(ScoreEngine, safety_at_upper_quartile_is_below_average)
{
    CrimeMap crime;
    for (unsigned int i = 0; i < 100; ++i)
        crime["S" + std::to_string(i)] = i;
    ScoreEngine engine(crime, PerformanceMap{});

    unsigned int const p75 = static_cast<unsigned int>(engine.crimeBaseline().p75);
    ASSERT_EQ(75u, p75);

    // A route as dangerous as the upper crime quartile is safer than only a
    // quarter of the network, so it lands at 4, not in the 8-9 band.
    EXPECT_EQ(4, engine.safetyScore({"S" + std::to_string(p75)}));
}

TEST(ScoreEngine, reliability_is_share_of_lines_strictly_worse)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());

    EXPECT_EQ(8, engine.reliabilityScore({"D"}));
    EXPECT_EQ(6, engine.reliabilityScore({"C"}));
    EXPECT_EQ(2, engine.reliabilityScore({"A"}));
    EXPECT_EQ(6, engine.reliabilityScore({"Z"}));
}

TEST(ScoreEngine, empty_inputs_score_five)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());

    EXPECT_EQ(5, engine.safetyScore({}));
    EXPECT_EQ(5, engine.reliabilityScore({}));
}

TEST(ScoreEngine, without_data_compares_against_neutral_mean)
{
    ScoreEngine engine(CrimeMap{}, PerformanceMap{});

    EXPECT_EQ(6, engine.safetyScore({"Anywhere"}));
    EXPECT_EQ(6, engine.reliabilityScore({"A"}));
}

TEST(ScoreEngine, efficiency_per_transfer_count)
{
    EXPECT_EQ(10, ScoreEngine::efficiencyScore(0));
    EXPECT_EQ(9, ScoreEngine::efficiencyScore(1));
    EXPECT_EQ(7, ScoreEngine::efficiencyScore(2));
    // The linear formula sits above the labelled bands at 3 (4-5) and 4 (0-3).
    EXPECT_EQ(6, ScoreEngine::efficiencyScore(3));
    EXPECT_EQ(4, ScoreEngine::efficiencyScore(4));
    EXPECT_EQ(3, ScoreEngine::efficiencyScore(5));
    EXPECT_EQ(1, ScoreEngine::efficiencyScore(6));
    EXPECT_EQ(0, ScoreEngine::efficiencyScore(7));
    EXPECT_EQ(0, ScoreEngine::efficiencyScore(12));
}

TEST(ScoreEngine, route_scores)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());

    Route route;
    route.name = "FastRoute";
    route.stations = {"S1", "S2"};
    route.lines = {"D"};
    route.totalTransfers = 1;

    std::vector<Route> routes{route};
    engine.scoreRoutes(routes);

    ASSERT_TRUE(routes.front().scores);
    EXPECT_EQ(8, routes.front().scores->safety);   // avg 5, 3 of 4 at or above
    EXPECT_EQ(8, routes.front().scores->reliability);
    EXPECT_EQ(9, routes.front().scores->efficiency);
}

TEST(ScoreEngine, update_rederives_baselines)
{
    ScoreEngine engine(sampleCrime(), samplePerformance());
    EXPECT_DOUBLE_EQ(15.0, engine.crimeBaseline().mean);

    engine.updateCrimeData({{"S1", 2}, {"S2", 4}});
    EXPECT_DOUBLE_EQ(3.0, engine.crimeBaseline().mean);
    EXPECT_EQ(10, engine.safetyScore({"S1"}));

    engine.updateLinePerformance({});
    EXPECT_DOUBLE_EQ(85.0, engine.reliabilityBaseline().mean);
}

TEST(ScoreEngine, interpretations)
{
    EXPECT_EQ("Very safe", ScoreEngine::interpretation(ScoreKind::Safety, 9));
    EXPECT_EQ("Avoid if possible", ScoreEngine::interpretation(ScoreKind::Safety, 1));
    EXPECT_EQ("Average (85-90% on-time)", ScoreEngine::interpretation(ScoreKind::Reliability, 5));
    EXPECT_EQ("Direct (0 transfers)", ScoreEngine::interpretation(ScoreKind::Efficiency, 10));
    EXPECT_EQ("Many transfers (4+)", ScoreEngine::interpretation(ScoreKind::Efficiency, 1));
}
