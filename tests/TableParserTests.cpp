#include "gtest/gtest.h"

#include <sstream>
#include "TableParser.hpp"

TEST(TableParser, lines_are_ordered_by_stop_sequence)
{
    std::istringstream in(
        "line_id,stop_sequence,station_name\n"
        "B,2,Delta\n"
        "A,1,Alpha\n"
        "A,3,Gamma\n"
        "A,2,Beta\n"
        "B,1, Beta \n");

    auto lines = TableParser::parseLineTopology(in);

    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("A", lines[0].line);
    EXPECT_EQ((std::vector<std::string>{"Alpha", "Beta", "Gamma"}), lines[0].stations);
    EXPECT_EQ("B", lines[1].line);
    EXPECT_EQ((std::vector<std::string>{"Beta", "Delta"}), lines[1].stations);
}

TEST(TableParser, malformed_line_rows_are_skipped)
{
    std::istringstream in(
        "line_id,stop_sequence,station_name\n"
        "A,1,Alpha\n"
        "A,two,Beta\n"
        "A,3\n"
        "\n"
        "A,4,Delta\r\n");

    auto lines = TableParser::parseLineTopology(in);

    ASSERT_EQ(1u, lines.size());
    EXPECT_EQ((std::vector<std::string>{"Alpha", "Delta"}), lines[0].stations);
}

TEST(TableParser, transfers)
{
    std::istringstream in(
        "from_station,from_line,to_station,to_line,walk_minutes\n"
        "Beta,A,Beta,B,1\n"
        "Delta,B,Delta,A,x\n"
        "Delta,A,Delta,,1\n");

    auto transfers = TableParser::parseTransfers(in);

    ASSERT_EQ(1u, transfers.size());
    EXPECT_EQ("Beta", transfers[0].fromStation);
    EXPECT_EQ("A", transfers[0].fromLine);
    EXPECT_EQ("B", transfers[0].toLine);
    EXPECT_EQ(1, transfers[0].walkMinutes);
}

TEST(TableParser, crime_counts_reject_negatives)
{
    std::istringstream in(
        "station_name,incident_count\n"
        "Alpha,12\n"
        "Beta,-3\n"
        "Gamma,0\n"
        "Delta,lots\n");

    auto crime = TableParser::parseCrimeCounts(in);

    EXPECT_EQ(2u, crime.size());
    EXPECT_EQ(12u, crime.at("Alpha"));
    EXPECT_EQ(0u, crime.at("Gamma"));
    EXPECT_EQ(0u, crime.count("Beta"));
}

TEST(TableParser, performance_must_be_a_percentage)
{
    std::istringstream in(
        "line_id,on_time_percent\n"
        "A,87.5\n"
        "B,101\n"
        "C,-1\n"
        "D,90\n");

    auto performance = TableParser::parseLinePerformance(in);

    EXPECT_EQ(2u, performance.size());
    EXPECT_DOUBLE_EQ(87.5, performance.at("A"));
    EXPECT_DOUBLE_EQ(90.0, performance.at("D"));
}

TEST(TableParser, performance_must_be_finite)
{
    std::istringstream in(
        "line_id,on_time_percent\n"
        "1,nan\n"
        "2,85\n"
        "3,inf\n"
        "4,-nan\n");

    auto performance = TableParser::parseLinePerformance(in);

    ASSERT_EQ(1u, performance.size());
    EXPECT_DOUBLE_EQ(85.0, performance.at("2"));
}

TEST(TableParser, out_of_range_numbers_are_skipped)
{
    std::istringstream crimeIn(
        "station_name,incident_count\n"
        "Alpha,4294967296\n"
        "Beta,4294967295\n"
        "Gamma,99999999999999999999\n");

    auto crime = TableParser::parseCrimeCounts(crimeIn);

    ASSERT_EQ(1u, crime.size());
    EXPECT_EQ(4294967295u, crime.at("Beta"));

    std::istringstream transferIn(
        "from_station,from_line,to_station,to_line,walk_minutes\n"
        "Beta,A,Beta,B,2147483648\n"
        "Delta,A,Delta,B,-2147483649\n"
        "Delta,B,Delta,A,3\n");

    auto transfers = TableParser::parseTransfers(transferIn);

    ASSERT_EQ(1u, transfers.size());
    EXPECT_EQ(3, transfers[0].walkMinutes);
}

TEST(TableParser, header_only_yields_empty_table)
{
    std::istringstream in("station_name,incident_count\n");

    EXPECT_TRUE(TableParser::parseCrimeCounts(in).empty());
}

TEST(TableParser, missing_file_yields_empty_table)
{
    EXPECT_TRUE(TableParser::loadLineTopology("/nonexistent/lines.csv").empty());
    EXPECT_TRUE(TableParser::loadCrimeCounts("/nonexistent/crime.csv").empty());
}
