#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include "Types.hpp"

struct StationInfo
{
    std::string name;
    std::vector<std::string> lines;
    std::size_t lineCount = 0;
    bool isMajorHub = false;
};

class NetworkGraph
{
private:
    std::unordered_map<Node, std::vector<Neighbor>, NodeHash> adjacency;
    std::unordered_map<std::string, std::vector<std::string>> linesByStation;
    std::vector<std::string> sortedStations;
    std::size_t edges = 0;

    void addEdge(Node const& from, Neighbor neighbor);
    static void validate(std::vector<LineTopology> const& lines,
                         std::vector<TransferEdge> const& transfers);

public:
    static constexpr int kStopMinutes    = 2;
    static constexpr int kExpressMinutes = 3;
    static constexpr std::size_t kMajorHubLines = 4;

    // Throws std::invalid_argument when the tables reference a node that
    // no line serves, repeat a station on one line or carry negative walks.
    NetworkGraph(std::vector<LineTopology> const& lines,
                 std::vector<TransferEdge> const& transfers);

    std::vector<Neighbor> const& neighbors(std::string const& station, std::string const& line) const;
    std::vector<std::string> linesAt(std::string const& station) const;
    bool stationExists(std::string const& name) const;

    std::vector<std::string> const& stations() const noexcept { return sortedStations; }
    std::size_t nodeCount() const noexcept { return adjacency.size(); }
    std::size_t edgeCount() const noexcept { return edges; }

    std::optional<int> edgeMinutes(Node const& from, Node const& to) const;
    std::vector<std::string> commonLines(std::string const& a, std::string const& b) const;
    std::optional<StationInfo> stationInfo(std::string const& name) const;

    // Exact, then case and hyphen insensitive, then a station containing
    // the input, then the longest station named inside the input, then a
    // station whose name before the first hyphen appears in the input.
    std::optional<std::string> resolveStation(std::string const& text) const;
};
