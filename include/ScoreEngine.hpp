#pragma once
#include <memory>
#include <string>
#include <vector>
#include "Types.hpp"

struct BaselineStats
{
    double mean   = 0.0;
    double median = 0.0;
    double stdDev = 0.0;   // population
    double min    = 0.0;
    double max    = 0.0;
    double p25    = 0.0;
    double p50    = 0.0;
    double p75    = 0.0;
};

enum class ScoreKind
{
    Safety,
    Reliability,
    Efficiency
};

// Scores a route against the network-wide distribution of the data it
// was built with: "safer than X% of stations" rather than fixed thresholds.
class ScoreEngine
{
private:
    std::shared_ptr<CrimeMap const> crimeData;
    std::shared_ptr<PerformanceMap const> performanceData;
    BaselineStats crimeStats;
    BaselineStats reliabilityStats;

    static double tierScore(double percentile);

public:
    static BaselineStats const kNeutralCrimeBaseline;
    static BaselineStats const kNeutralReliabilityBaseline;

    ScoreEngine(std::shared_ptr<CrimeMap const> crime,
                std::shared_ptr<PerformanceMap const> performance);
    ScoreEngine(CrimeMap crime, PerformanceMap performance);

    RouteScores calculateRouteScores(Route const& route) const;
    void scoreRoutes(std::vector<Route>& routes) const;

    int safetyScore(std::vector<std::string> const& stations) const;
    int reliabilityScore(std::vector<std::string> const& lines) const;
    static int efficiencyScore(int transferCount);

    void updateCrimeData(CrimeMap crime);
    void updateLinePerformance(PerformanceMap performance);

    BaselineStats const& crimeBaseline() const noexcept { return crimeStats; }
    BaselineStats const& reliabilityBaseline() const noexcept { return reliabilityStats; }

    // Nearest-rank percentiles (sorted[floor(n * f)]); empty input yields fallback.
    static BaselineStats computeBaseline(std::vector<double> values, BaselineStats const& fallback);

    static std::string interpretation(ScoreKind kind, int score);
};
