#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "ShortestPathEngine.hpp"
#include "ScoreEngine.hpp"
#include "WeightPolicy.hpp"

class NetworkGraph;

enum class RankCriterion
{
    Safe,
    Fast,
    Balanced
};

std::optional<RankCriterion> parseCriterion(std::string const& text);

// Request-scoped: holds the crime and performance snapshots for one
// request and borrows the process-wide graph.
class RouteSynthesizer
{
private:
    ShortestPathEngine engine;
    std::shared_ptr<CrimeMap const> crimeData;
    std::shared_ptr<PerformanceMap const> performanceData;
    int maxTransfers;
    bool parallel = false;

    struct Request
    {
        std::string name;
        WeightPolicy policy;
    };

    std::vector<Request> buildRequests() const;
    std::vector<std::optional<Route>> runSequential(std::vector<Request> const& requests,
                                                    std::string const& origin,
                                                    std::string const& destination) const;
    std::vector<std::optional<Route>> runParallel(std::vector<Request> const& requests,
                                                  std::string const& origin,
                                                  std::string const& destination) const;

public:
    static inline const std::string SAFE_ROUTE     = "SafeRoute";
    static inline const std::string FAST_ROUTE     = "FastRoute";
    static inline const std::string BALANCED_ROUTE = "BalancedRoute";

    explicit RouteSynthesizer(NetworkGraph const& network,
                              int transferCeiling = ShortestPathEngine::kDefaultMaxTransfers);

    // SafeRoute, FastRoute, BalancedRoute in that order, minus any that
    // failed. nullopt only when all three failed.
    std::optional<std::vector<Route>> generateRoutes(std::string const& origin, std::string const& destination);
    std::optional<std::vector<Route>> generateRoutes(std::string const& origin, std::string const& destination,
                                                     CrimeMap crime, PerformanceMap performance);

    void updateCrimeData(CrimeMap crime);
    void updateLinePerformance(PerformanceMap performance);
    void setParallel(bool enabled) noexcept { parallel = enabled; }

    std::vector<Route> rankByCriterion(std::vector<Route> routes, RankCriterion criterion) const;
    std::vector<Route> rankByCriterion(std::vector<Route> routes, std::string const& criterion) const;

    ScoreEngine makeScoreEngine() const;

    std::shared_ptr<CrimeMap const> crimeSnapshot() const noexcept { return crimeData; }
    ShortestPathEngine const& pathEngine() const noexcept { return engine; }
};
