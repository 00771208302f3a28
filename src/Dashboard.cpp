#include <sstream>
#include "Types.hpp"
#include "ScoreEngine.hpp"
#include "SubwayTables.hpp"
#include "Dashboard.hpp"

std::string Dashboard::escape(std::string const& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
        case '&':  out += "&amp;";  break;
        case '<':  out += "&lt;";   break;
        case '>':  out += "&gt;";   break;
        case '\'': out += "&#39;";  break;
        case '"':  out += "&quot;"; break;
        default:   out += c;
        }
    }
    return out;
}

std::string Dashboard::buildHtmlHead(std::vector<Route> const& routes, std::string const& criterion)
{
    std::stringstream ss;

    ss << "<html><head><title>SmartRoute</title>"
       << "<style>"
       << "body { font-family: sans-serif; background: #1a1a1a; color: #ddd; padding: 20px; }"
       << "h1 { color: #3498db; border-bottom: 2px solid #444; padding-bottom: 10px; }"
       << "table { width: 100%; border-collapse: collapse; margin-top: 20px; }"
       << "th { text-align: left; background: #333; padding: 10px; border-bottom: 2px solid #555; }"
       << "td { padding: 10px; border-bottom: 1px solid #333; vertical-align: top; }"
       << "tr:hover { background: #2c2c2c; }"
       << ".score-high { color: #2ecc71; font-weight: bold; }"
       << ".score-mid { color: #f1c40f; font-weight: bold; }"
       << ".score-low { color: #e74c3c; font-weight: bold; }"
       << ".badge { background: #444; padding: 2px 5px; border-radius: 3px; "
                     "font-size: 0.8em; margin-right:5px;}"
       << "</style>"
       << "<meta charset='UTF-8'>"
       << "</head><body>";

    ss << "<h1>Route Options</h1>";
    if (!routes.empty() && !routes.front().stations.empty())
    {
        ss << "<p>" << escape(routes.front().stations.front()) << " &rarr; "
           << escape(routes.front().stations.back()) << "</p>";
    }
    ss << "<p>Ranked by: " << escape(criterion) << " (" << routes.size() << " routes)</p>";

    return ss.str();
}

std::string Dashboard::buildTableHeader()
{
    std::stringstream ss;
    ss << "<table><thead><tr>"
       << "<th>Route</th>"
       << "<th>Lines</th>"
       << "<th>Itinerary</th>"
       << "<th>Time</th>"
       << "<th>Transfers</th>"
       << "<th>Safety</th>"
       << "<th>Reliability</th>"
       << "<th>Efficiency</th>"
       << "</tr></thead><tbody>";
    return ss.str();
}

std::string Dashboard::formatScore(int score, std::string const& label)
{
    std::string cls = "score-low";
    if (score >= 7)      cls = "score-high";
    else if (score >= 5) cls = "score-mid";

    std::stringstream ss;
    ss << "<span class='" << cls << "'>" << score << "/10</span>"
       << "<div style='font-size:0.75em; color:#aaa; margin-top:4px;'>"
       << escape(label) << "</div>";
    return ss.str();
}

std::string Dashboard::formatSegment(Segment const& s)
{
    std::stringstream ss;
    if (s.type == SegmentType::Transfer)
    {
        ss << "Transfer at " << s.station << " (" << s.fromLine << " to " << s.toLine
           << ", " << s.minutes << "m)";
    }
    else
    {
        ss << "Ride " << s.line << " " << s.fromStation << " to " << s.toStation
           << " (" << s.stopCount << " stops, " << s.minutes << "m)";
    }
    return ss.str();
}

std::string Dashboard::buildRow(Route const& r)
{
    std::stringstream ss;
    ss << "<tr>"
       << "<td><b>" << escape(r.name) << "</b></td><td>";

    auto const& info = SubwayTables::lineInfo();
    for (auto const& line : r.lines)
    {
        auto it = info.find(line);
        if (it == info.end())
        {
            ss << "<span class='badge'>" << escape(line) << "</span>";
            continue;
        }
        ss << "<span class='badge' style='background:" << it->second.color << ";' title='"
           << escape(it->second.name) << "'>" << escape(line) << "</span>";
    }

    ss << "</td><td>";
    for (auto const& s : r.segments)
        ss << escape(formatSegment(s)) << "<br>";

    ss << "</td>"
       << "<td><b>" << r.totalTimeMinutes << "m</b></td>"
       << "<td>" << r.totalTransfers << "</td>";

    if (r.scores)
    {
        ss << "<td>" << formatScore(r.scores->safety,
                                    ScoreEngine::interpretation(ScoreKind::Safety, r.scores->safety)) << "</td>"
           << "<td>" << formatScore(r.scores->reliability,
                                    ScoreEngine::interpretation(ScoreKind::Reliability, r.scores->reliability)) << "</td>"
           << "<td>" << formatScore(r.scores->efficiency,
                                    ScoreEngine::interpretation(ScoreKind::Efficiency, r.scores->efficiency)) << "</td>";
    }
    else
    {
        ss << "<td>-</td><td>-</td><td>-</td>";
    }

    ss << "</tr>";
    return ss.str();
}

std::string Dashboard::generate(std::vector<Route> const& routes, std::string const& criterion)
{
    std::stringstream ss;
    ss << buildHtmlHead(routes, criterion);
    ss << buildTableHeader();

    for (const auto& r : routes)
    {
        ss << buildRow(r);
    }

    ss << "</tbody></table></body></html>";

    return ss.str();
}

std::string Dashboard::summary(std::vector<Route> const& routes)
{
    std::stringstream ss;
    for (auto const& r : routes)
    {
        ss << "\n" << r.name << ": " << r.totalTimeMinutes << " min, "
           << r.totalTransfers << " transfers, " << r.totalStops << " stops\n";

        ss << "   Lines:";
        for (auto const& line : r.lines)
            ss << " " << line;
        ss << "\n";

        for (auto const& s : r.segments)
            ss << "   - " << formatSegment(s) << "\n";

        if (r.scores)
        {
            ss << "   Safety " << r.scores->safety << "/10 ("
               << ScoreEngine::interpretation(ScoreKind::Safety, r.scores->safety) << ")"
               << ", Reliability " << r.scores->reliability << "/10 ("
               << ScoreEngine::interpretation(ScoreKind::Reliability, r.scores->reliability) << ")"
               << ", Efficiency " << r.scores->efficiency << "/10 ("
               << ScoreEngine::interpretation(ScoreKind::Efficiency, r.scores->efficiency) << ")\n";
        }
    }
    return ss.str();
}
