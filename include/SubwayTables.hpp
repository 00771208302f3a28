#pragma once
#include <map>
#include <string>
#include <vector>
#include "Types.hpp"

struct LineInfo
{
    double onTimePercent;
    std::string color;
    std::string name;     // corridor, e.g. "Lexington Ave"
};

// Built-in snapshot of the Manhattan/Brooklyn/Queens core network.
// Station names match across lines; a transfer only names nodes that exist.
class SubwayTables
{
public:
    static std::vector<LineTopology> const& lines();
    static std::vector<TransferEdge> const& transfers();
    static std::map<std::string, LineInfo> const& lineInfo();
    static PerformanceMap linePerformance();
};
