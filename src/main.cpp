#include <string>
#include <iostream>
#include <fstream>
#include <optional>
#include <stdexcept>
#include "ConfigurationManager.hpp"
#include "Types.hpp"
#include "SubwayTables.hpp"
#include "TableParser.hpp"
#include "NetworkGraph.hpp"
#include "RouteSynthesizer.hpp"
#include "ScoreEngine.hpp"
#include "Dashboard.hpp"

struct CommandLine
{
    std::string from;
    std::string to;
    std::string criterion = "balanced";
    std::optional<std::string> htmlFile;
    bool listStations = false;
};

struct NetworkTables
{
    std::vector<LineTopology> lines;
    std::vector<TransferEdge> transfers;
    CrimeMap crime;
    PerformanceMap performance;
};

CommandLine parseCommandLineArgs(int argc, char* argv[], ConfigurationManager& config)
{
    CommandLine cmd;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--from" && hasValue)
        {
            cmd.from = argv[++i];
        }
        else if (arg == "--to" && hasValue)
        {
            cmd.to = argv[++i];
        }
        else if (arg == "--criterion" && hasValue)
        {
            cmd.criterion = argv[++i];
        }
        else if (arg == "--data" && hasValue)
        {
            config.setDataDir(argv[++i]);
        }
        else if (arg == "--max-transfers" && hasValue)
        {
            config.setMaxTransfers(ConfigurationManager::parseMaxTransfers(argv[++i]));
        }
        else if (arg == "--parallel")
        {
            config.setParallel(true);
        }
        else if (arg == "--html" && hasValue)
        {
            cmd.htmlFile = argv[++i];
        }
        else if (arg == "--list-stations")
        {
            cmd.listStations = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }

    return cmd;
}

NetworkTables loadTables(ConfigurationManager const& config)
{
    NetworkTables tables;
    auto files = config.getDataFiles();

    if (!files)
    {
        std::cout << "[System] Using built-in network tables." << std::endl;
        tables.lines = SubwayTables::lines();
        tables.transfers = SubwayTables::transfers();
        tables.performance = SubwayTables::linePerformance();
        return tables;
    }

    std::cout << "[System] Loading tables from " << *config.getDataDir() << std::endl;
    tables.lines = TableParser::loadLineTopology(files->lines);
    tables.transfers = TableParser::loadTransfers(files->transfers);
    tables.crime = TableParser::loadCrimeCounts(files->crime);
    tables.performance = TableParser::loadLinePerformance(files->performance);

    if (tables.lines.empty())
        throw std::runtime_error("no line topology found in " + files->lines);

    return tables;
}

int main(int argc, char* argv[])
{
    try
    {
        ConfigurationManager config;
        CommandLine cmd = parseCommandLineArgs(argc, argv, config);

        auto ranking = parseCriterion(cmd.criterion);
        if (!ranking)
        {
            std::cerr << "Unknown criterion '" << cmd.criterion << "', expected safe, fast or balanced.\n";
            return 1;
        }

        NetworkTables tables = loadTables(config);
        NetworkGraph graph(tables.lines, tables.transfers);

        if (cmd.listStations)
        {
            for (auto const& name : graph.stations())
            {
                auto info = graph.stationInfo(name);
                std::cout << name << " [";
                for (std::size_t i = 0; i < info->lines.size(); ++i)
                    std::cout << (i ? " " : "") << info->lines[i];
                std::cout << "]" << (info->isMajorHub ? " hub" : "") << "\n";
            }
            return 0;
        }

        if (cmd.from.empty() || cmd.to.empty())
        {
            std::cerr << "Usage: smartroute --from STATION --to STATION [--criterion safe|fast|balanced]"
                         " [--data DIR] [--max-transfers N] [--parallel] [--html FILE] [--list-stations]\n";
            return 1;
        }

        auto origin = graph.resolveStation(cmd.from);
        auto destination = graph.resolveStation(cmd.to);
        if (!origin || !destination)
        {
            std::cerr << "Unknown station: " << (origin ? cmd.to : cmd.from) << "\n";
            return 1;
        }

        RouteSynthesizer synthesizer(graph, config.getMaxTransfers());
        synthesizer.setParallel(config.isParallel());

        auto routes = synthesizer.generateRoutes(*origin, *destination,
                                                 std::move(tables.crime), std::move(tables.performance));
        if (!routes)
        {
            std::cerr << "No route found from " << *origin << " to " << *destination << "\n";
            return 1;
        }

        synthesizer.makeScoreEngine().scoreRoutes(*routes);
        auto ranked = synthesizer.rankByCriterion(std::move(*routes), *ranking);

        std::cout << "\n" << *origin << " -> " << *destination << " (ranked by " << cmd.criterion << ")\n";
        std::cout << Dashboard::summary(ranked);

        if (cmd.htmlFile)
        {
            std::ofstream out(*cmd.htmlFile);
            if (!out.is_open())
                throw std::runtime_error("could not write " + *cmd.htmlFile);
            out << Dashboard::generate(ranked, cmd.criterion);
            std::cout << "   -> Report written to " << *cmd.htmlFile << "\n";
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
