#include "RouteSynthesizer.hpp"

#include <iostream>
#include <algorithm>
#include <future>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

std::optional<RankCriterion> parseCriterion(std::string const& text)
{
    if (text == "safe")     return RankCriterion::Safe;
    if (text == "fast")     return RankCriterion::Fast;
    if (text == "balanced") return RankCriterion::Balanced;
    return std::nullopt;
}

RouteSynthesizer::RouteSynthesizer(NetworkGraph const& network, int transferCeiling)
    : engine(network)
    , crimeData(std::make_shared<CrimeMap const>())
    , performanceData(std::make_shared<PerformanceMap const>())
    , maxTransfers(transferCeiling)
{
}

void RouteSynthesizer::updateCrimeData(CrimeMap crime)
{
    crimeData = std::make_shared<CrimeMap const>(std::move(crime));
    std::cout << "[Synth] Updated crime data for " << crimeData->size() << " stations\n";
}

void RouteSynthesizer::updateLinePerformance(PerformanceMap performance)
{
    performanceData = std::make_shared<PerformanceMap const>(std::move(performance));
}

std::vector<RouteSynthesizer::Request> RouteSynthesizer::buildRequests() const
{
    return {
        {SAFE_ROUTE,     WeightPolicy::safe(crimeData)},
        {FAST_ROUTE,     WeightPolicy::fast()},
        {BALANCED_ROUTE, WeightPolicy::balanced(crimeData)},
    };
}

std::vector<std::optional<Route>> RouteSynthesizer::runSequential(std::vector<Request> const& requests,
                                                                  std::string const& origin,
                                                                  std::string const& destination) const
{
    std::vector<std::optional<Route>> results;
    results.reserve(requests.size());

    for (auto const& request : requests)
        results.push_back(engine.findPath(origin, destination, request.policy, maxTransfers));

    return results;
}

std::vector<std::optional<Route>> RouteSynthesizer::runParallel(std::vector<Request> const& requests,
                                                                std::string const& origin,
                                                                std::string const& destination) const
{
    boost::asio::thread_pool pool(requests.size());
    std::vector<std::future<std::optional<Route>>> pending;
    pending.reserve(requests.size());

    // Each task reads the shared graph and its own policy only.
    for (auto const& request : requests)
    {
        auto task = std::make_shared<std::packaged_task<std::optional<Route>()>>(
            [this, &request, &origin, &destination]()
            {
                return engine.findPath(origin, destination, request.policy, maxTransfers);
            });

        pending.push_back(task->get_future());
        boost::asio::post(pool, [task]() { (*task)(); });
    }

    pool.join();

    std::vector<std::optional<Route>> results;
    results.reserve(pending.size());
    for (auto& future : pending)
        results.push_back(future.get());

    return results;
}

std::optional<std::vector<Route>> RouteSynthesizer::generateRoutes(std::string const& origin,
                                                                   std::string const& destination)
{
    std::cout << "[Synth] Generating routes: " << origin << " -> " << destination << "\n";

    auto const requests = buildRequests();
    auto results = parallel ? runParallel(requests, origin, destination)
                            : runSequential(requests, origin, destination);

    std::vector<Route> routes;
    for (std::size_t i = 0; i < requests.size(); ++i)
    {
        if (!results[i])
        {
            std::cerr << "[Synth] Could not generate " << requests[i].name << "\n";
            continue;
        }

        Route route = std::move(*results[i]);
        route.name = requests[i].name;

        std::cout << "   | " << route.name << ": " << route.totalStops << " stops, "
                  << route.totalTransfers << " transfers, "
                  << route.totalTimeMinutes << " min\n";

        routes.push_back(std::move(route));
    }

    if (routes.empty())
    {
        std::cerr << "[Synth] No route between " << origin << " and " << destination << "\n";
        return std::nullopt;
    }

    return routes;
}

std::optional<std::vector<Route>> RouteSynthesizer::generateRoutes(std::string const& origin,
                                                                   std::string const& destination,
                                                                   CrimeMap crime, PerformanceMap performance)
{
    updateCrimeData(std::move(crime));
    updateLinePerformance(std::move(performance));
    return generateRoutes(origin, destination);
}

std::vector<Route> RouteSynthesizer::rankByCriterion(std::vector<Route> routes, RankCriterion criterion) const
{
    switch (criterion)
    {
    case RankCriterion::Safe:
    {
        auto exposure = [this](Route const& route)
        {
            unsigned long total = 0;
            for (auto const& station : route.stations)
            {
                auto it = crimeData->find(station);
                total += (it != crimeData->end()) ? it->second : WeightPolicy::kDefaultCrimeCount;
            }
            return total;
        };
        std::stable_sort(routes.begin(), routes.end(),
                         [&exposure](Route const& a, Route const& b) { return exposure(a) < exposure(b); });
        break;
    }
    case RankCriterion::Fast:
        std::stable_sort(routes.begin(), routes.end(),
                         [](Route const& a, Route const& b) { return a.totalTimeMinutes < b.totalTimeMinutes; });
        break;

    case RankCriterion::Balanced:
        std::stable_sort(routes.begin(), routes.end(),
                         [](Route const& a, Route const& b) { return a.totalTransfers < b.totalTransfers; });
        break;
    }

    return routes;
}

std::vector<Route> RouteSynthesizer::rankByCriterion(std::vector<Route> routes, std::string const& criterion) const
{
    auto parsed = parseCriterion(criterion);
    if (!parsed)
        return routes;

    return rankByCriterion(std::move(routes), *parsed);
}

ScoreEngine RouteSynthesizer::makeScoreEngine() const
{
    return ScoreEngine(crimeData, performanceData);
}
