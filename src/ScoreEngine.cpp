#include "ScoreEngine.hpp"

#include <iostream>
#include <algorithm>
#include <cmath>
#include <numeric>

BaselineStats const ScoreEngine::kNeutralCrimeBaseline       = {5, 5, 2, 0, 20, 3, 5, 8};
BaselineStats const ScoreEngine::kNeutralReliabilityBaseline = {85, 85, 3, 77, 92, 82, 85, 88};

namespace
{
std::vector<double> crimeValues(CrimeMap const& crime)
{
    std::vector<double> values;
    values.reserve(crime.size());
    for (auto const& entry : crime)
        values.push_back(static_cast<double>(entry.second));
    return values;
}

std::vector<double> performanceValues(PerformanceMap const& performance)
{
    std::vector<double> values;
    values.reserve(performance.size());
    for (auto const& entry : performance)
        values.push_back(entry.second);
    return values;
}
}

ScoreEngine::ScoreEngine(std::shared_ptr<CrimeMap const> crime,
                         std::shared_ptr<PerformanceMap const> performance)
    : crimeData(crime ? std::move(crime) : std::make_shared<CrimeMap const>())
    , performanceData(performance ? std::move(performance) : std::make_shared<PerformanceMap const>())
{
    crimeStats       = computeBaseline(crimeValues(*crimeData), kNeutralCrimeBaseline);
    reliabilityStats = computeBaseline(performanceValues(*performanceData), kNeutralReliabilityBaseline);

    std::cout << "[Score] Crime baseline: " << crimeStats.mean << " incidents/station over "
              << crimeData->size() << " stations\n"
              << "[Score] Reliability baseline: " << reliabilityStats.mean << "% on-time over "
              << performanceData->size() << " lines\n";
}

ScoreEngine::ScoreEngine(CrimeMap crime, PerformanceMap performance)
    : ScoreEngine(std::make_shared<CrimeMap const>(std::move(crime)),
                  std::make_shared<PerformanceMap const>(std::move(performance)))
{
}

BaselineStats ScoreEngine::computeBaseline(std::vector<double> values, BaselineStats const& fallback)
{
    if (values.empty())
        return fallback;

    std::sort(values.begin(), values.end());
    std::size_t const n = values.size();

    BaselineStats stats;
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);
    stats.median = (n % 2 == 1) ? values[n / 2]
                                : (values[n / 2 - 1] + values[n / 2]) / 2.0;

    double squares = 0.0;
    for (double v : values)
        squares += (v - stats.mean) * (v - stats.mean);
    stats.stdDev = std::sqrt(squares / static_cast<double>(n));

    stats.min = values.front();
    stats.max = values.back();

    auto nearestRank = [&values, n](double fraction)
    {
        return values[static_cast<std::size_t>(std::floor(static_cast<double>(n) * fraction))];
    };
    stats.p25 = nearestRank(0.25);
    stats.p50 = nearestRank(0.50);
    stats.p75 = nearestRank(0.75);

    return stats;
}

double ScoreEngine::tierScore(double percentile)
{
    if (percentile >= 90.0) return 10.0;
    if (percentile >= 75.0) return 8.0 + (percentile - 75.0) / 15.0;
    if (percentile >= 50.0) return 6.0 + (percentile - 50.0) / 25.0;
    if (percentile >= 25.0) return 4.0 + (percentile - 25.0) / 25.0;
    return 2.0 + percentile / 25.0;
}

int ScoreEngine::safetyScore(std::vector<std::string> const& stations) const
{
    if (stations.empty())
        return 5;

    // Stations without data count as typical, not as safe.
    double total = 0.0;
    for (auto const& station : stations)
    {
        auto it = crimeData->find(station);
        total += (it != crimeData->end()) ? static_cast<double>(it->second) : crimeStats.mean;
    }
    double const routeAverage = total / static_cast<double>(stations.size());

    double percentile = 0.0;
    if (!crimeData->empty())
    {
        // Share of the network at least as dangerous as this route.
        auto const atLeast = std::count_if(crimeData->begin(), crimeData->end(),
                                           [routeAverage](auto const& entry)
                                           { return static_cast<double>(entry.second) >= routeAverage; });
        percentile = static_cast<double>(atLeast) / static_cast<double>(crimeData->size()) * 100.0;
    }
    else
    {
        percentile = (routeAverage <= crimeStats.mean) ? 50.0 : 30.0;
    }

    return static_cast<int>(std::lround(tierScore(percentile)));
}

int ScoreEngine::reliabilityScore(std::vector<std::string> const& lines) const
{
    if (lines.empty())
        return 5;

    double total = 0.0;
    for (auto const& line : lines)
    {
        auto it = performanceData->find(line);
        total += (it != performanceData->end()) ? it->second : reliabilityStats.mean;
    }
    double const routeAverage = total / static_cast<double>(lines.size());

    double percentile = 0.0;
    if (!performanceData->empty())
    {
        auto const below = std::count_if(performanceData->begin(), performanceData->end(),
                                         [routeAverage](auto const& entry)
                                         { return entry.second < routeAverage; });
        percentile = static_cast<double>(below) / static_cast<double>(performanceData->size()) * 100.0;
    }
    else
    {
        percentile = (routeAverage >= reliabilityStats.mean) ? 50.0 : 30.0;
    }

    return static_cast<int>(std::lround(tierScore(percentile)));
}

int ScoreEngine::efficiencyScore(int transferCount)
{
    double const raw = 10.0 - 1.5 * static_cast<double>(transferCount);
    return static_cast<int>(std::lround(std::clamp(raw, 0.0, 10.0)));
}

RouteScores ScoreEngine::calculateRouteScores(Route const& route) const
{
    RouteScores scores;
    scores.safety      = safetyScore(route.stations);
    scores.reliability = reliabilityScore(route.lines);
    scores.efficiency  = efficiencyScore(route.totalTransfers);
    return scores;
}

void ScoreEngine::scoreRoutes(std::vector<Route>& routes) const
{
    for (auto& route : routes)
    {
        route.scores = calculateRouteScores(route);
        std::cout << "[Score] " << route.name << ": safety=" << route.scores->safety
                  << " reliability=" << route.scores->reliability
                  << " efficiency=" << route.scores->efficiency << "\n";
    }
}

void ScoreEngine::updateCrimeData(CrimeMap crime)
{
    crimeData  = std::make_shared<CrimeMap const>(std::move(crime));
    crimeStats = computeBaseline(crimeValues(*crimeData), kNeutralCrimeBaseline);
    std::cout << "[Score] Updated crime data for " << crimeData->size() << " stations\n";
}

void ScoreEngine::updateLinePerformance(PerformanceMap performance)
{
    performanceData  = std::make_shared<PerformanceMap const>(std::move(performance));
    reliabilityStats = computeBaseline(performanceValues(*performanceData), kNeutralReliabilityBaseline);
    std::cout << "[Score] Updated performance data for " << performanceData->size() << " lines\n";
}

std::string ScoreEngine::interpretation(ScoreKind kind, int score)
{
    switch (kind)
    {
    case ScoreKind::Safety:
        if (score >= 9) return "Very safe";
        if (score >= 7) return "Safe";
        if (score >= 5) return "Moderate";
        if (score >= 3) return "Less safe";
        return "Avoid if possible";

    case ScoreKind::Reliability:
        if (score >= 9) return "Excellent (95%+ on-time)";
        if (score >= 7) return "Good (90-95% on-time)";
        if (score >= 5) return "Average (85-90% on-time)";
        if (score >= 3) return "Poor (75-85% on-time)";
        return "Very unreliable (<75%)";

    case ScoreKind::Efficiency:
        if (score >= 9) return "Direct (0 transfers)";
        if (score >= 7) return "Very efficient (1 transfer)";
        if (score >= 5) return "Efficient (2 transfers)";
        if (score >= 3) return "Multiple transfers (3)";
        return "Many transfers (4+)";
    }

    return "Score: " + std::to_string(score) + "/10";
}
