#include "ShortestPathEngine.hpp"

#include <iostream>
#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>
#include <unordered_set>
#include <vector>
#include "NetworkGraph.hpp"

namespace
{
struct QueueEntry
{
    double cost;
    int transfers;
    Node node;
};

// Min-heap order. Equal costs fall back to fewer transfers, then node
// name, so a search never depends on insertion order.
struct LaterEntry
{
    bool operator()(QueueEntry const& a, QueueEntry const& b) const
    {
        if (a.cost != b.cost)
            return a.cost > b.cost;
        if (a.transfers != b.transfers)
            return a.transfers > b.transfers;
        return b.node < a.node;
    }
};
}

ShortestPathEngine::ShortestPathEngine(NetworkGraph const& network)
    : graph(network)
{
}

double ShortestPathEngine::checkedCost(WeightPolicy const& policy, EdgeStep const& step)
{
    double const cost = policy(step);
    if (!std::isfinite(cost) || cost < 0.0)
    {
        throw std::domain_error("weight policy '" + toString(policy.kind()) +
                                "' returned an invalid cost for " + step.fromStation +
                                " -> " + step.toStation);
    }
    return cost;
}

std::optional<ShortestPathEngine::SearchResult>
ShortestPathEngine::search(Node const& start, std::string const& destination,
                           WeightPolicy const& policy, int maxTransfers) const
{
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, LaterEntry> frontier;
    std::unordered_map<Node, double, NodeHash> distance;
    std::unordered_set<Node, NodeHash> settled;
    std::unordered_map<Node, PredecessorLink, NodeHash> previous;

    distance[start] = 0.0;
    frontier.push({0.0, 0, start});

    while (!frontier.empty())
    {
        QueueEntry current = frontier.top();
        frontier.pop();

        if (!settled.insert(current.node).second)
            continue;

        if (current.node.station == destination)
        {
            SearchResult result;
            result.start     = start;
            result.end       = current.node;
            result.cost      = current.cost;
            result.transfers = current.transfers;
            result.previous  = std::move(previous);
            return result;
        }

        // Over the ceiling: the node stays settled but is not expanded.
        if (current.transfers > maxTransfers)
            continue;

        for (auto const& next : graph.neighbors(current.node.station, current.node.line))
        {
            Node nextNode{next.station, next.line};
            if (settled.count(nextNode))
                continue;

            bool const isTransfer = next.line != current.node.line;
            EdgeStep const step{current.node.station, next.station,
                                current.node.line, next.line,
                                next.minutes, isTransfer};

            double const cost   = current.cost + checkedCost(policy, step);
            int const transfers = current.transfers + (isTransfer ? 1 : 0);

            auto it = distance.find(nextNode);
            if (it == distance.end() || cost < it->second)
            {
                distance[nextNode] = cost;
                previous[nextNode] = {current.node, next.minutes, isTransfer};
                frontier.push({cost, transfers, std::move(nextNode)});
            }
        }
    }

    return std::nullopt;
}

Route ShortestPathEngine::extractRoute(SearchResult const& result) const
{
    std::vector<Node> path;
    int totalTime      = 0;
    int totalTransfers = 0;

    Node current = result.end;
    while (!(current == result.start))
    {
        auto it = result.previous.find(current);
        if (it == result.previous.end() || path.size() > result.previous.size())
            throw std::logic_error("broken predecessor chain at " + current.station);

        path.push_back(current);
        totalTime += it->second.minutes;
        if (it->second.isTransfer)
            ++totalTransfers;

        current = it->second.previous;
    }
    path.push_back(result.start);
    std::reverse(path.begin(), path.end());

    Route route;
    route.path             = path;
    route.totalTimeMinutes = totalTime;
    route.totalTransfers   = totalTransfers;
    route.totalStops       = static_cast<int>(path.size());

    for (auto const& node : path)
    {
        route.stations.push_back(node.station);
        if (route.lines.empty() || route.lines.back() != node.line)
            route.lines.push_back(node.line);
    }

    // Rides are estimated at a flat rate per stop, not from the edge minutes.
    auto closeRide = [&route](std::string const& line, std::string const& from,
                              std::string const& to, int stops)
    {
        Segment ride;
        ride.type        = SegmentType::Ride;
        ride.line        = line;
        ride.fromStation = from;
        ride.toStation   = to;
        ride.stopCount   = stops;
        ride.minutes     = kRideMinutesPerStop * stops;
        route.segments.push_back(std::move(ride));
    };

    std::size_t runStart = 0;
    for (std::size_t i = 1; i < path.size(); ++i)
    {
        if (path[i].line == path[runStart].line)
            continue;

        closeRide(path[runStart].line, path[runStart].station, path[i - 1].station,
                  static_cast<int>(i - 1 - runStart));

        Segment change;
        change.type     = SegmentType::Transfer;
        change.station  = path[i].station;
        change.fromLine = path[runStart].line;
        change.toLine   = path[i].line;
        change.minutes  = kTransferSegmentMinutes;
        route.segments.push_back(std::move(change));

        runStart = i;
    }
    closeRide(path[runStart].line, path[runStart].station, path.back().station,
              static_cast<int>(path.size() - 1 - runStart));

    return route;
}

std::optional<Route> ShortestPathEngine::findPath(std::string const& origin, std::string const& destination,
                                                  WeightPolicy const& policy, int maxTransfers) const
{
    if (!graph.stationExists(origin))
    {
        std::cerr << "[Router] Unknown origin station: " << origin << "\n";
        return std::nullopt;
    }

    if (!graph.stationExists(destination))
    {
        std::cerr << "[Router] Unknown destination station: " << destination << "\n";
        return std::nullopt;
    }

    if (origin == destination)
    {
        Route route;
        route.stations   = {origin};
        route.totalStops = 1;
        return route;
    }

    auto const startLines = graph.linesAt(origin);
    if (startLines.empty())
    {
        std::cerr << "[Router] No line serves " << origin << "\n";
        return std::nullopt;
    }

    // Lines are visited in sorted order and only a strictly better
    // (cost, transfers) pair replaces the incumbent.
    std::optional<SearchResult> best;
    for (auto const& line : startLines)
    {
        auto result = search({origin, line}, destination, policy, maxTransfers);
        if (!result)
            continue;

        if (!best || result->cost < best->cost ||
            (result->cost == best->cost && result->transfers < best->transfers))
        {
            best = std::move(result);
        }
    }

    if (!best)
    {
        std::cerr << "[Router] No path from " << origin << " to " << destination
                  << " within " << maxTransfers << " transfers\n";
        return std::nullopt;
    }

    Route route = extractRoute(*best);
    route.weightedCost = best->cost;
    return route;
}

std::optional<double> ShortestPathEngine::pathCost(Route const& route, WeightPolicy const& policy) const
{
    double total = 0.0;

    for (std::size_t i = 1; i < route.path.size(); ++i)
    {
        Node const& from = route.path[i - 1];
        Node const& to   = route.path[i];

        auto minutes = graph.edgeMinutes(from, to);
        if (!minutes)
            return std::nullopt;

        EdgeStep const step{from.station, to.station, from.line, to.line,
                            *minutes, from.line != to.line};
        total += checkedCost(policy, step);
    }

    return total;
}
