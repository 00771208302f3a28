#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include "Types.hpp"
#include "WeightPolicy.hpp"

class NetworkGraph;

class ShortestPathEngine
{
private:
    struct PredecessorLink
    {
        Node previous;
        int minutes = 0;
        bool isTransfer = false;
    };

    // Terminal state of one single-line search.
    struct SearchResult
    {
        Node start;
        Node end;
        double cost = 0.0;
        int transfers = 0;
        std::unordered_map<Node, PredecessorLink, NodeHash> previous;
    };

    NetworkGraph const& graph;

    std::optional<SearchResult> search(Node const& start, std::string const& destination,
                                       WeightPolicy const& policy, int maxTransfers) const;
    Route extractRoute(SearchResult const& result) const;
    static double checkedCost(WeightPolicy const& policy, EdgeStep const& step);

public:
    static constexpr int kDefaultMaxTransfers  = 5;
    static constexpr int kRideMinutesPerStop   = 2;
    static constexpr int kTransferSegmentMinutes = 2;

    explicit ShortestPathEngine(NetworkGraph const& network);

    // nullopt when either station is unknown or no path respects the
    // transfer ceiling. Never throws for those cases.
    std::optional<Route> findPath(std::string const& origin, std::string const& destination,
                                  WeightPolicy const& policy,
                                  int maxTransfers = kDefaultMaxTransfers) const;

    // Cost of an already built route under another policy.
    std::optional<double> pathCost(Route const& route, WeightPolicy const& policy) const;
};
