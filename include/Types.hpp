#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <functional>
#include <unordered_map>

using CrimeMap       = std::unordered_map<std::string, unsigned int>;   // station -> incidents
using PerformanceMap = std::unordered_map<std::string, double>;         // line -> on-time %

// The search vertex: the same station reached on two lines is two nodes.
struct Node
{
    std::string station;
    std::string line;

    bool operator==(Node const& other) const
    {
        return station == other.station && line == other.line;
    }

    bool operator<(Node const& other) const
    {
        if (station != other.station)
            return station < other.station;
        return line < other.line;
    }
};

struct NodeHash
{
    std::size_t operator()(Node const& n) const noexcept
    {
        std::size_t h = std::hash<std::string>{}(n.station);
        return h ^ (std::hash<std::string>{}(n.line) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

struct Neighbor
{
    std::string station;
    std::string line;
    int minutes = 0;
};

struct LineTopology
{
    std::string line;
    std::vector<std::string> stations;   // in stopping order
};

// One-directional walk from one platform to another.
struct TransferEdge
{
    std::string fromStation;
    std::string fromLine;
    std::string toStation;
    std::string toLine;
    int walkMinutes = 0;
};

enum class SegmentType
{
    Ride,
    Transfer
};

struct Segment
{
    SegmentType type = SegmentType::Ride;

    // Ride
    std::string line;
    std::string fromStation;
    std::string toStation;
    int stopCount = 0;

    // Transfer
    std::string station;
    std::string fromLine;
    std::string toLine;

    int minutes = 0;
};

struct RouteScores
{
    int safety      = 0;
    int reliability = 0;
    int efficiency  = 0;
};

struct Route
{
    std::string name;                     // "SafeRoute", ... set by the synthesizer
    std::vector<std::string> stations;
    std::vector<std::string> lines;       // one entry per run of the same line
    std::vector<Node> path;               // raw node walk, empty for a same-station trip
    std::vector<Segment> segments;
    int totalTimeMinutes = 0;             // raw minutes, never the weighted cost
    int totalTransfers   = 0;
    int totalStops       = 0;
    double weightedCost  = 0.0;
    std::optional<RouteScores> scores;
};
