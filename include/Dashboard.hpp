#pragma once
#include <string>
#include <vector>

struct Route;
struct Segment;

class Dashboard
{
public:
    // Static HTML comparison page, one row per route.
    static std::string generate(std::vector<Route> const& routes, std::string const& criterion);

    // Console rendering used by the CLI.
    static std::string summary(std::vector<Route> const& routes);

private:
    static std::string escape(std::string const& text);
    static std::string buildHtmlHead(std::vector<Route> const& routes, std::string const& criterion);
    static std::string buildTableHeader();
    static std::string formatScore(int score, std::string const& label);
    static std::string formatSegment(Segment const& s);
    static std::string buildRow(Route const& r);
};
