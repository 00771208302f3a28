#include "NetworkGraph.hpp"

#include <iostream>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <stdexcept>

namespace
{
std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Case and hyphen insensitive form used for name matching.
std::string normalize(std::string const& text)
{
    std::string out = toLower(text);
    std::replace(out.begin(), out.end(), '-', ' ');
    return out;
}
}

void NetworkGraph::validate(std::vector<LineTopology> const& lines,
                            std::vector<TransferEdge> const& transfers)
{
    std::unordered_set<Node, NodeHash> served;

    for (auto const& topology : lines)
    {
        if (topology.line.empty())
            throw std::invalid_argument("line with an empty code");

        if (topology.stations.size() < 2)
            throw std::invalid_argument("line " + topology.line + " has fewer than two stations");

        for (auto const& station : topology.stations)
        {
            if (station.empty())
                throw std::invalid_argument("line " + topology.line + " lists an empty station name");

            if (!served.insert({station, topology.line}).second)
                throw std::invalid_argument("line " + topology.line + " stops at " + station + " twice");
        }
    }

    for (auto const& t : transfers)
    {
        if (t.walkMinutes < 0)
            throw std::invalid_argument("negative walk time at " + t.fromStation);

        if (!served.count({t.fromStation, t.fromLine}))
            throw std::invalid_argument("transfer from " + t.fromStation + " (" + t.fromLine +
                                        "): line does not stop there");

        if (!served.count({t.toStation, t.toLine}))
            throw std::invalid_argument("transfer to " + t.toStation + " (" + t.toLine +
                                        "): line does not stop there");
    }
}

NetworkGraph::NetworkGraph(std::vector<LineTopology> const& lines,
                           std::vector<TransferEdge> const& transfers)
{
    validate(lines, transfers);

    std::unordered_map<std::string, std::set<std::string>> servedBy;

    for (auto const& topology : lines)
    {
        auto const& stops = topology.stations;
        std::size_t const n = stops.size();

        for (std::size_t i = 0; i + 1 < n; ++i)
        {
            // Every third hop inside the line models an express skip.
            int minutes = kStopMinutes;
            if (i > 0 && i < n - 2 && i % 3 == 0)
                minutes = kExpressMinutes;

            addEdge({stops[i], topology.line}, {stops[i + 1], topology.line, minutes});
            addEdge({stops[i + 1], topology.line}, {stops[i], topology.line, minutes});
        }

        for (auto const& station : stops)
            servedBy[station].insert(topology.line);
    }

    for (auto const& t : transfers)
        addEdge({t.fromStation, t.fromLine}, {t.toStation, t.toLine, t.walkMinutes});

    for (auto& [station, codes] : servedBy)
    {
        linesByStation[station].assign(codes.begin(), codes.end());
        sortedStations.push_back(station);
    }
    std::sort(sortedStations.begin(), sortedStations.end());

    std::cout << "[Graph] Built " << adjacency.size() << " (station, line) nodes, "
              << edges << " edges over " << sortedStations.size() << " stations\n";
}

void NetworkGraph::addEdge(Node const& from, Neighbor neighbor)
{
    adjacency[from].push_back(std::move(neighbor));
    ++edges;
}

std::vector<Neighbor> const& NetworkGraph::neighbors(std::string const& station, std::string const& line) const
{
    static const std::vector<Neighbor> none;

    auto it = adjacency.find({station, line});
    if (it != adjacency.end())
        return it->second;

    return none;
}

std::vector<std::string> NetworkGraph::linesAt(std::string const& station) const
{
    auto it = linesByStation.find(station);
    if (it != linesByStation.end())
        return it->second;

    return {};
}

bool NetworkGraph::stationExists(std::string const& name) const
{
    return linesByStation.count(name) > 0;
}

// A declared walk can run parallel to a ride; the shorter edge wins.
std::optional<int> NetworkGraph::edgeMinutes(Node const& from, Node const& to) const
{
    std::optional<int> shortest;
    for (auto const& n : neighbors(from.station, from.line))
    {
        if (n.station == to.station && n.line == to.line && (!shortest || n.minutes < *shortest))
            shortest = n.minutes;
    }
    return shortest;
}

std::vector<std::string> NetworkGraph::commonLines(std::string const& a, std::string const& b) const
{
    auto linesA = linesAt(a);
    auto linesB = linesAt(b);

    std::vector<std::string> shared;
    std::set_intersection(linesA.begin(), linesA.end(), linesB.begin(), linesB.end(),
                          std::back_inserter(shared));
    return shared;
}

std::optional<StationInfo> NetworkGraph::stationInfo(std::string const& name) const
{
    if (!stationExists(name))
        return std::nullopt;

    StationInfo info;
    info.name       = name;
    info.lines      = linesAt(name);
    info.lineCount  = info.lines.size();
    info.isMajorHub = info.lineCount >= kMajorHubLines;
    return info;
}

std::optional<std::string> NetworkGraph::resolveStation(std::string const& text) const
{
    if (text.empty())
        return std::nullopt;

    if (stationExists(text))
        return text;

    std::string const wanted = normalize(text);

    for (auto const& station : sortedStations)
    {
        if (normalize(station) == wanted)
            return station;
    }

    auto resolved = [&text](std::string const& station)
    {
        std::cout << "[Graph] Resolved '" << text << "' to " << station << "\n";
        return std::optional<std::string>(station);
    };

    for (auto const& station : sortedStations)
    {
        if (normalize(station).find(wanted) != std::string::npos)
            return resolved(station);
    }

    // The longest full name inside the input is the most specific one.
    std::string const* longest = nullptr;
    for (auto const& station : sortedStations)
    {
        if (wanted.find(normalize(station)) != std::string::npos &&
            (!longest || station.size() > longest->size()))
        {
            longest = &station;
        }
    }
    if (longest)
        return resolved(*longest);

    for (auto const& station : sortedStations)
    {
        std::string const lowered = toLower(station);
        std::string const head    = lowered.substr(0, lowered.find('-'));

        if (wanted.find(head) != std::string::npos)
            return resolved(station);
    }

    std::cerr << "[Graph] No station matches '" << text << "'\n";
    return std::nullopt;
}
