#include "SubwayTables.hpp"

std::vector<LineTopology> const& SubwayTables::lines()
{
    static const std::vector<LineTopology> table = {
        {"1", {   // Broadway-Seventh Ave
            "South Ferry",
            "Rector Street",
            "Cortlandt Street",
            "Chambers Street",
            "Franklin Street",
            "Canal Street",
            "Spring Street",
            "Houston Street",
            "14th Street",
            "18th Street",
            "23rd Street",
            "28th Street",
            "34th Street-Herald Square",
            "Times Square-42nd Street",
            "49th Street",
            "59th Street-Columbus Circle",
            "72nd Street",
            "79th Street",
        }},
        {"2", {   // Broadway-Seventh Ave
            "Bowling Green",
            "Wall Street",
            "Fulton Street",
            "Park Place",
            "Chambers Street",
            "Franklin Street",
            "Canal Street",
            "Spring Street",
            "Houston Street",
            "14th Street",
            "18th Street",
            "23rd Street",
            "28th Street",
            "34th Street-Herald Square",
            "Times Square-42nd Street",
            "49th Street",
            "59th Street-Columbus Circle",
            "72nd Street",
        }},
        {"3", {   // Broadway-Seventh Ave
            "Bowling Green",
            "Wall Street",
            "Fulton Street",
            "Park Place",
            "Chambers Street",
            "Franklin Street",
            "Canal Street",
            "Spring Street",
            "Houston Street",
            "14th Street",
            "18th Street",
            "23rd Street",
            "28th Street",
            "34th Street-Herald Square",
            "Times Square-42nd Street",
            "49th Street",
            "59th Street-Columbus Circle",
            "72nd Street",
        }},
        {"4", {   // Lexington Ave
            "Bowling Green",
            "Wall Street",
            "Fulton Street",
            "Park Place",
            "Chambers Street",
            "Brooklyn Bridge-City Hall",
            "Spring Street",
            "Canal Street",
            "14th Street-Union Square",
            "18th Street",
            "23rd Street-Lexington",
            "28th Street-Lexington",
            "33rd Street",
            "Grand Central-42nd Street",
            "59th Street",
            "86th Street",
        }},
        {"5", {   // Lexington Ave
            "Bowling Green",
            "Wall Street",
            "Fulton Street",
            "Park Place",
            "Chambers Street",
            "Brooklyn Bridge-City Hall",
            "Spring Street",
            "Canal Street",
            "14th Street-Union Square",
            "18th Street",
            "23rd Street-Lexington",
            "28th Street-Lexington",
            "33rd Street",
            "Grand Central-42nd Street",
            "59th Street",
            "86th Street",
        }},
        {"6", {   // Lexington Ave
            "Bowling Green",
            "Wall Street",
            "Fulton Street",
            "Park Place",
            "Chambers Street",
            "Brooklyn Bridge-City Hall",
            "Spring Street",
            "Canal Street",
            "14th Street-Union Square",
            "18th Street",
            "23rd Street-Lexington",
            "28th Street-Lexington",
            "33rd Street",
            "Grand Central-42nd Street",
            "59th Street",
        }},
        {"A", {   // Eighth Ave
            "Inwood-207th Street",
            "175th Street",
            "145th Street",
            "125th Street",
            "59th Street-Columbus Circle",
            "42nd Street-Port Authority",
            "34th Street-Penn Station",
            "14th Street",
            "8th Avenue-14th Street",
            "West 4th Street",
            "Spring Street",
            "Canal Street",
            "Chambers Street",
            "Fulton Street",
            "Jay Street-MetroTech",
            "High Street-Brooklyn Bridge",
            "Hoyt-Schermerhorn",
            "Carroll Street",
            "Nostrand Avenue",
            "Kingston-Throop Avenues",
        }},
        {"C", {   // Eighth Ave
            "168th Street",
            "145th Street",
            "125th Street",
            "110th Street",
            "72nd Street",
            "59th Street-Columbus Circle",
            "42nd Street-Port Authority",
            "34th Street-Penn Station",
            "14th Street",
            "8th Avenue-14th Street",
            "West 4th Street",
            "Spring Street",
            "Canal Street",
            "Chambers Street",
            "Fulton Street",
            "Jay Street-MetroTech",
            "Hoyt-Schermerhorn",
            "Carroll Street",
            "Nostrand Avenue",
        }},
        {"E", {   // Eighth Ave
            "Jamaica Center-Parsons/Archer",
            "Forest Hills-71st Avenue",
            "Jackson Heights-Roosevelt Avenue",
            "42nd Street-Port Authority",
            "34th Street-Penn Station",
            "14th Street",
            "8th Avenue-14th Street",
            "West 4th Street",
            "Spring Street",
            "Canal Street",
            "World Trade Center",
        }},
        {"F", {   // Culver
            "Jamaica Center-Parsons/Archer",
            "Forest Hills-71st Avenue",
            "Jackson Heights-Roosevelt Avenue",
            "23rd Street-Broadway-Lafayette",
            "14th Street-Broadway-Lafayette",
            "West 4th Street",
            "Broadway-Lafayette",
            "Spring Street",
            "Canal Street",
            "Chambers Street",
            "Jay Street-MetroTech",
            "Carroll Street",
            "Court Street",
            "Bergen Street",
            "Hoyt-Schermerhorn",
        }},
        {"N", {   // Broadway
            "Astoria-Ditmars Boulevard",
            "30th Avenue",
            "Astoria Boulevard",
            "Queensboro Plaza",
            "Lexington Avenue",
            "Herald Square",
            "28th Street-Broadway",
            "23rd Street-Broadway",
            "14th Street",
            "8th Street",
            "Union Square-14th Street",
            "Canal Street",
            "Chambers Street",
            "Cortlandt Street",
            "Rector Street",
            "Whitehall Terminal",
        }},
        {"Q", {   // Broadway
            "96th Street",
            "72nd Street",
            "57th Street",
            "Times Square-42nd Street",
            "34th Street",
            "Herald Square",
            "28th Street-Broadway",
            "23rd Street-Broadway",
            "14th Street",
            "Canal Street",
            "Chambers Street",
            "Cortlandt Street",
            "Bowling Green",
        }},
        {"R", {   // Broadway
            "Forest Hills-71st Avenue",
            "Jackson Heights-Roosevelt Avenue",
            "Queensboro Plaza",
            "Lexington Avenue",
            "Herald Square",
            "28th Street-Broadway",
            "23rd Street-Broadway",
            "14th Street",
            "8th Street",
            "Canal Street",
            "Chambers Street",
            "Cortlandt Street",
            "Rector Street",
            "Whitehall Terminal",
        }},
        {"W", {   // Broadway
            "Astoria-Ditmars Boulevard",
            "30th Avenue",
            "Astoria Boulevard",
            "Queensboro Plaza",
            "Lexington Avenue",
            "Herald Square",
            "28th Street-Broadway",
            "23rd Street-Broadway",
            "14th Street",
            "Canal Street",
            "Chambers Street",
            "Cortlandt Street",
            "Whitehall Terminal",
        }},
        {"L", {   // 14th St-Canarsie
            "8th Avenue-14th Street",
            "6th Avenue",
            "Union Square-14th Street",
            "1st Avenue",
            "Bedford Avenue",
            "Lorimer Street",
            "Graham Avenue",
            "Jefferson Street",
            "Myrtle Avenue",
        }},
        {"G", {   // Crosstown
            "Court Square",
            "Greenpoint Avenue",
            "Nassau Avenue",
            "Metropolitan Avenue",
            "Broadway",
            "Myrtle-Willoughby Avenues",
            "Clinton-Washington",
            "Classon Avenue",
            "Nostrand Avenue",
            "Bedford-Stuyvesant",
            "Hoyt-Schermerhorn",
            "Carroll Street",
            "Fulton Street",
        }},
        {"S", {   // Shuttle Service
            "Times Square-42nd Street",
            "Grand Central-42nd Street",
        }},
        {"7", {   // Flushing
            "Flushing-Main Street",
            "Woodside",
            "Jackson Heights-Roosevelt Avenue",
            "Queens Plaza",
            "Lexington Avenue",
            "Grand Central-42nd Street",
            "34th Street-Herald Square",
            "28th Street",
            "23rd Street",
            "18th Street",
            "14th Street",
            "Times Square-42nd Street",
        }},
    };
    return table;
}

std::vector<TransferEdge> const& SubwayTables::transfers()
{
    static const std::vector<TransferEdge> table = {
        // Canal Street, 1
        {"Canal Street", "1", "Canal Street", "2", 1},
        {"Canal Street", "1", "Canal Street", "3", 1},
        {"Canal Street", "1", "Canal Street", "4", 2},
        {"Canal Street", "1", "Canal Street", "5", 2},
        {"Canal Street", "1", "Canal Street", "6", 2},
        {"Canal Street", "1", "Canal Street", "A", 2},
        {"Canal Street", "1", "Canal Street", "C", 2},

        // Canal Street, N
        {"Canal Street", "N", "Canal Street", "R", 1},
        {"Canal Street", "N", "Canal Street", "W", 1},
        {"Canal Street", "N", "Canal Street", "A", 2},
        {"Canal Street", "N", "Canal Street", "C", 2},
        {"Canal Street", "N", "Canal Street", "1", 2},
        {"Canal Street", "N", "Canal Street", "2", 2},
        {"Canal Street", "N", "Canal Street", "6", 2},

        // Times Square-42nd Street, 1
        {"Times Square-42nd Street", "1", "Times Square-42nd Street", "2", 1},
        {"Times Square-42nd Street", "1", "Times Square-42nd Street", "3", 1},
        {"Times Square-42nd Street", "1", "Times Square-42nd Street", "Q", 2},
        {"Times Square-42nd Street", "1", "Times Square-42nd Street", "S", 1},
        {"Times Square-42nd Street", "1", "Grand Central-42nd Street", "4", 3},
        {"Times Square-42nd Street", "1", "Grand Central-42nd Street", "5", 3},
        {"Times Square-42nd Street", "1", "Grand Central-42nd Street", "6", 3},
        {"Times Square-42nd Street", "1", "Grand Central-42nd Street", "7", 3},

        // Times Square-42nd Street, S
        {"Times Square-42nd Street", "S", "Grand Central-42nd Street", "4", 1},
        {"Times Square-42nd Street", "S", "Grand Central-42nd Street", "5", 1},
        {"Times Square-42nd Street", "S", "Grand Central-42nd Street", "6", 1},
        {"Times Square-42nd Street", "S", "Grand Central-42nd Street", "7", 1},

        // Grand Central-42nd Street, 4
        {"Grand Central-42nd Street", "4", "Times Square-42nd Street", "1", 3},
        {"Grand Central-42nd Street", "4", "Times Square-42nd Street", "3", 3},
        {"Grand Central-42nd Street", "4", "Times Square-42nd Street", "S", 1},

        // Grand Central-42nd Street, 5
        {"Grand Central-42nd Street", "5", "Times Square-42nd Street", "1", 3},
        {"Grand Central-42nd Street", "5", "Times Square-42nd Street", "3", 3},
        {"Grand Central-42nd Street", "5", "Times Square-42nd Street", "S", 1},

        // Grand Central-42nd Street, 6
        {"Grand Central-42nd Street", "6", "Times Square-42nd Street", "1", 3},
        {"Grand Central-42nd Street", "6", "Times Square-42nd Street", "3", 3},
        {"Grand Central-42nd Street", "6", "Times Square-42nd Street", "S", 1},

        // Grand Central-42nd Street, 7
        {"Grand Central-42nd Street", "7", "Times Square-42nd Street", "1", 3},
        {"Grand Central-42nd Street", "7", "Times Square-42nd Street", "S", 1},

        // Grand Central-42nd Street, S
        {"Grand Central-42nd Street", "S", "Times Square-42nd Street", "1", 1},
        {"Grand Central-42nd Street", "S", "Times Square-42nd Street", "3", 1},

        // 14th Street, 1
        {"14th Street", "1", "14th Street", "2", 1},
        {"14th Street", "1", "14th Street", "3", 1},
        {"14th Street", "1", "14th Street-Union Square", "4", 2},
        {"14th Street", "1", "14th Street-Union Square", "5", 2},
        {"14th Street", "1", "14th Street-Union Square", "6", 2},
        {"14th Street", "1", "Union Square-14th Street", "L", 1},
        {"14th Street", "1", "14th Street", "N", 2},
        {"14th Street", "1", "14th Street", "Q", 2},
        {"14th Street", "1", "14th Street", "R", 2},
        {"14th Street", "1", "14th Street", "W", 2},
        {"14th Street", "1", "8th Avenue-14th Street", "A", 2},
        {"14th Street", "1", "8th Avenue-14th Street", "C", 2},
        {"14th Street", "1", "8th Avenue-14th Street", "E", 2},
        {"14th Street", "1", "8th Avenue-14th Street", "L", 2},

        // Jay Street-MetroTech, A
        {"Jay Street-MetroTech", "A", "Jay Street-MetroTech", "C", 1},
        {"Jay Street-MetroTech", "A", "Jay Street-MetroTech", "F", 2},
        {"Jay Street-MetroTech", "A", "High Street-Brooklyn Bridge", "A", 1},

        // Jay Street-MetroTech, C
        {"Jay Street-MetroTech", "C", "Jay Street-MetroTech", "A", 1},
        {"Jay Street-MetroTech", "C", "Jay Street-MetroTech", "F", 2},

        // Fulton Street, 2
        {"Fulton Street", "2", "Fulton Street", "3", 1},
        {"Fulton Street", "2", "Fulton Street", "4", 1},
        {"Fulton Street", "2", "Fulton Street", "5", 1},
        {"Fulton Street", "2", "Fulton Street", "6", 1},
        {"Fulton Street", "2", "Fulton Street", "A", 1},
        {"Fulton Street", "2", "Fulton Street", "C", 1},

        // Fulton Street, 3
        {"Fulton Street", "3", "Fulton Street", "2", 1},
        {"Fulton Street", "3", "Fulton Street", "4", 1},
        {"Fulton Street", "3", "Fulton Street", "5", 1},
        {"Fulton Street", "3", "Fulton Street", "6", 1},
        {"Fulton Street", "3", "Fulton Street", "A", 1},
        {"Fulton Street", "3", "Fulton Street", "C", 1},

        // Fulton Street, 4
        {"Fulton Street", "4", "Fulton Street", "2", 1},
        {"Fulton Street", "4", "Fulton Street", "3", 1},
        {"Fulton Street", "4", "Fulton Street", "5", 1},
        {"Fulton Street", "4", "Fulton Street", "6", 1},
        {"Fulton Street", "4", "Fulton Street", "A", 1},
        {"Fulton Street", "4", "Fulton Street", "C", 1},

        // Fulton Street, 5
        {"Fulton Street", "5", "Fulton Street", "2", 1},
        {"Fulton Street", "5", "Fulton Street", "3", 1},
        {"Fulton Street", "5", "Fulton Street", "4", 1},
        {"Fulton Street", "5", "Fulton Street", "6", 1},
        {"Fulton Street", "5", "Fulton Street", "A", 1},
        {"Fulton Street", "5", "Fulton Street", "C", 1},

        // Fulton Street, 6
        {"Fulton Street", "6", "Fulton Street", "2", 1},
        {"Fulton Street", "6", "Fulton Street", "3", 1},
        {"Fulton Street", "6", "Fulton Street", "4", 1},
        {"Fulton Street", "6", "Fulton Street", "5", 1},
        {"Fulton Street", "6", "Fulton Street", "A", 1},
        {"Fulton Street", "6", "Fulton Street", "C", 1},

        // Fulton Street, A
        {"Fulton Street", "A", "Fulton Street", "C", 1},
        {"Fulton Street", "A", "Fulton Street", "2", 1},
        {"Fulton Street", "A", "Fulton Street", "3", 1},
        {"Fulton Street", "A", "Fulton Street", "4", 1},
        {"Fulton Street", "A", "Fulton Street", "5", 1},
        {"Fulton Street", "A", "Fulton Street", "6", 1},

        // Fulton Street, C
        {"Fulton Street", "C", "Fulton Street", "A", 1},
        {"Fulton Street", "C", "Fulton Street", "2", 1},
        {"Fulton Street", "C", "Fulton Street", "3", 1},
        {"Fulton Street", "C", "Fulton Street", "4", 1},
        {"Fulton Street", "C", "Fulton Street", "5", 1},
        {"Fulton Street", "C", "Fulton Street", "6", 1},

        // Canal Street, A
        {"Canal Street", "A", "Canal Street", "C", 1},
        {"Canal Street", "A", "Canal Street", "1", 2},
        {"Canal Street", "A", "Canal Street", "2", 2},
        {"Canal Street", "A", "Canal Street", "4", 2},
        {"Canal Street", "A", "Canal Street", "5", 2},
        {"Canal Street", "A", "Canal Street", "6", 2},
        {"Canal Street", "A", "Jay Street-MetroTech", "A", 3},

        // Canal Street, C
        {"Canal Street", "C", "Canal Street", "A", 1},
        {"Canal Street", "C", "Canal Street", "1", 2},
        {"Canal Street", "C", "Canal Street", "2", 2},
        {"Canal Street", "C", "Canal Street", "4", 2},
        {"Canal Street", "C", "Canal Street", "5", 2},
        {"Canal Street", "C", "Canal Street", "6", 2},
        {"Canal Street", "C", "Jay Street-MetroTech", "C", 3},
    };
    return table;
}

std::map<std::string, LineInfo> const& SubwayTables::lineInfo()
{
    static const std::map<std::string, LineInfo> table = {
        {"1", {88, "red", "Broadway-Seventh Ave"}},
        {"2", {85, "red", "Broadway-Seventh Ave"}},
        {"3", {85, "red", "Broadway-Seventh Ave"}},
        {"4", {87, "green", "Lexington Ave"}},
        {"5", {86, "green", "Lexington Ave"}},
        {"6", {88, "green", "Lexington Ave"}},
        {"A", {82, "blue", "Eighth Ave"}},
        {"C", {81, "blue", "Eighth Ave"}},
        {"E", {83, "blue", "Eighth Ave"}},
        {"F", {78, "orange", "Culver"}},
        {"G", {80, "green", "Crosstown"}},
        {"N", {79, "yellow", "Broadway"}},
        {"Q", {84, "yellow", "Broadway"}},
        {"R", {80, "yellow", "Broadway"}},
        {"W", {77, "yellow", "Broadway"}},
        {"L", {85, "gray", "14th St-Canarsie"}},
        {"7", {83, "red", "Flushing"}},
        {"S", {92, "gray", "Shuttle Service"}},
    };
    return table;
}

PerformanceMap SubwayTables::linePerformance()
{
    PerformanceMap performance;
    for (auto const& [line, info] : lineInfo())
        performance[line] = info.onTimePercent;
    return performance;
}
