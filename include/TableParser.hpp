#pragma once
#include <istream>
#include <string>
#include <vector>
#include "Types.hpp"

// CSV readers for the four reference tables. Each expects a header row;
// malformed rows are skipped with a warning on stderr.
class TableParser
{
public:
    static std::vector<LineTopology> parseLineTopology(std::istream& in);
    static std::vector<TransferEdge> parseTransfers(std::istream& in);
    static CrimeMap parseCrimeCounts(std::istream& in);
    static PerformanceMap parseLinePerformance(std::istream& in);

    // File variants return an empty table when the file cannot be opened.
    static std::vector<LineTopology> loadLineTopology(std::string const& path);
    static std::vector<TransferEdge> loadTransfers(std::string const& path);
    static CrimeMap loadCrimeCounts(std::string const& path);
    static PerformanceMap loadLinePerformance(std::string const& path);
};
