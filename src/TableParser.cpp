#include "TableParser.hpp"

#include <iostream>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>

namespace
{
std::string trim(std::string const& text)
{
    auto const first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";

    auto const last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<long> toInteger(std::string const& text)
{
    if (text.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0')
        return std::nullopt;

    return value;
}

std::optional<double> toDecimal(std::string const& text)
{
    if (text.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(value))
        return std::nullopt;

    return value;
}

template <typename RowHandler>
void forEachRow(std::istream& in, std::size_t minFields, char const* table, RowHandler handle)
{
    std::string line;
    std::getline(in, line);

    std::size_t lineNumber = 1;
    while (std::getline(in, line))
    {
        ++lineNumber;
        if (trim(line).empty()) continue;

        std::stringstream ss(line);
        std::vector<std::string> row;
        std::string field;
        while (std::getline(ss, field, ','))
            row.push_back(trim(field));

        if (row.size() < minFields || !handle(row))
        {
            std::cerr << "[Tables] Skipping malformed " << table << " row " << lineNumber
                      << ": " << line << "\n";
        }
    }
}

template <typename Table>
Table loadFile(std::string const& path, Table (*parse)(std::istream&))
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "ERROR: Could not open " << path << "\n";
        return {};
    }
    return parse(file);
}
}

std::vector<LineTopology> TableParser::parseLineTopology(std::istream& in)
{
    std::map<std::string, std::vector<std::pair<long, std::string>>> stopsByLine;

    forEachRow(in, 3, "lines", [&stopsByLine](std::vector<std::string> const& row)
    {
        auto sequence = toInteger(row[1]);
        if (row[0].empty() || row[2].empty() || !sequence)
            return false;

        stopsByLine[row[0]].emplace_back(*sequence, row[2]);
        return true;
    });

    std::vector<LineTopology> lines;
    for (auto& [line, stops] : stopsByLine)
    {
        std::stable_sort(stops.begin(), stops.end(),
                         [](auto const& a, auto const& b) { return a.first < b.first; });

        LineTopology topology;
        topology.line = line;
        for (auto& stop : stops)
            topology.stations.push_back(std::move(stop.second));

        lines.push_back(std::move(topology));
    }

    std::cout << "[Tables] Loaded " << lines.size() << " lines\n";
    return lines;
}

std::vector<TransferEdge> TableParser::parseTransfers(std::istream& in)
{
    std::vector<TransferEdge> transfers;

    forEachRow(in, 5, "transfers", [&transfers](std::vector<std::string> const& row)
    {
        auto walk = toInteger(row[4]);
        if (!walk || row[0].empty() || row[1].empty() || row[2].empty() || row[3].empty())
            return false;

        if (*walk < std::numeric_limits<int>::min() || *walk > std::numeric_limits<int>::max())
            return false;

        transfers.push_back({row[0], row[1], row[2], row[3], static_cast<int>(*walk)});
        return true;
    });

    std::cout << "[Tables] Loaded " << transfers.size() << " transfers\n";
    return transfers;
}

CrimeMap TableParser::parseCrimeCounts(std::istream& in)
{
    CrimeMap crime;

    forEachRow(in, 2, "crime", [&crime](std::vector<std::string> const& row)
    {
        auto count = toInteger(row[1]);
        if (row[0].empty() || !count || *count < 0 ||
            static_cast<unsigned long>(*count) > std::numeric_limits<unsigned int>::max())
            return false;

        crime[row[0]] = static_cast<unsigned int>(*count);
        return true;
    });

    std::cout << "[Tables] Loaded crime counts for " << crime.size() << " stations\n";
    return crime;
}

PerformanceMap TableParser::parseLinePerformance(std::istream& in)
{
    PerformanceMap performance;

    forEachRow(in, 2, "performance", [&performance](std::vector<std::string> const& row)
    {
        auto percent = toDecimal(row[1]);
        if (row[0].empty() || !percent || *percent < 0.0 || *percent > 100.0)
            return false;

        performance[row[0]] = *percent;
        return true;
    });

    std::cout << "[Tables] Loaded on-time performance for " << performance.size() << " lines\n";
    return performance;
}

std::vector<LineTopology> TableParser::loadLineTopology(std::string const& path)
{
    return loadFile(path, &TableParser::parseLineTopology);
}

std::vector<TransferEdge> TableParser::loadTransfers(std::string const& path)
{
    return loadFile(path, &TableParser::parseTransfers);
}

CrimeMap TableParser::loadCrimeCounts(std::string const& path)
{
    return loadFile(path, &TableParser::parseCrimeCounts);
}

PerformanceMap TableParser::loadLinePerformance(std::string const& path)
{
    return loadFile(path, &TableParser::parseLinePerformance);
}
