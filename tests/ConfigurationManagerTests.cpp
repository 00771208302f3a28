#include "gtest/gtest.h"

#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

namespace
{
class ConfigurationManagerTest : public ::testing::Test
{
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        unsetenv("SMARTROUTE_DATA_DIR");
        unsetenv("SMARTROUTE_MAX_TRANSFERS");
        unsetenv("SMARTROUTE_PARALLEL");
    }
};
}

TEST_F(ConfigurationManagerTest, defaults)
{
    ConfigurationManager config;

    EXPECT_FALSE(config.getDataDir());
    EXPECT_FALSE(config.getDataFiles());
    EXPECT_EQ(5, config.getMaxTransfers());
    EXPECT_FALSE(config.isParallel());
}

TEST_F(ConfigurationManagerTest, reads_environment)
{
    setenv("SMARTROUTE_DATA_DIR", "/srv/tables", 1);
    setenv("SMARTROUTE_MAX_TRANSFERS", "2", 1);
    setenv("SMARTROUTE_PARALLEL", "1", 1);

    ConfigurationManager config;

    EXPECT_EQ("/srv/tables", config.getDataDir());
    EXPECT_EQ(2, config.getMaxTransfers());
    EXPECT_TRUE(config.isParallel());

    auto files = config.getDataFiles();
    ASSERT_TRUE(files);
    EXPECT_EQ("/srv/tables/lines.csv", files->lines);
    EXPECT_EQ("/srv/tables/transfers.csv", files->transfers);
    EXPECT_EQ("/srv/tables/crime.csv", files->crime);
    EXPECT_EQ("/srv/tables/performance.csv", files->performance);
}

TEST_F(ConfigurationManagerTest, invalid_environment_throws)
{
    setenv("SMARTROUTE_PARALLEL", "yes", 1);
    EXPECT_THROW(ConfigurationManager{}, std::runtime_error);

    unsetenv("SMARTROUTE_PARALLEL");
    setenv("SMARTROUTE_MAX_TRANSFERS", "21", 1);
    EXPECT_THROW(ConfigurationManager{}, std::runtime_error);
}

TEST_F(ConfigurationManagerTest, flags_override_environment)
{
    setenv("SMARTROUTE_MAX_TRANSFERS", "2", 1);
    ConfigurationManager config;

    config.setMaxTransfers(7);
    config.setDataDir("data/");

    EXPECT_EQ(7, config.getMaxTransfers());
    EXPECT_EQ("data/lines.csv", config.getDataFiles()->lines);
    EXPECT_THROW(config.setMaxTransfers(-1), std::runtime_error);
    EXPECT_THROW(config.setDataDir(""), std::runtime_error);
}

TEST_F(ConfigurationManagerTest, parse_max_transfers)
{
    EXPECT_EQ(0, ConfigurationManager::parseMaxTransfers("0"));
    EXPECT_EQ(20, ConfigurationManager::parseMaxTransfers("20"));
    EXPECT_THROW(ConfigurationManager::parseMaxTransfers("21"), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::parseMaxTransfers("-1"), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::parseMaxTransfers("3x"), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::parseMaxTransfers("many"), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::parseMaxTransfers(""), std::runtime_error);
}
