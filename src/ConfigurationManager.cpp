#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
{
    const char* envDataDir = std::getenv("SMARTROUTE_DATA_DIR");
    if (envDataDir && *envDataDir) dataDir = envDataDir;

    const char* envMaxTransfers = std::getenv("SMARTROUTE_MAX_TRANSFERS");
    if (envMaxTransfers) maxTransfers = parseMaxTransfers(envMaxTransfers);

    const char* envParallel = std::getenv("SMARTROUTE_PARALLEL");
    if (envParallel)
    {
        std::string value = envParallel;
        if (value == "1")      parallel = true;
        else if (value == "0") parallel = false;
        else throw std::runtime_error("SMARTROUTE_PARALLEL must be 0 or 1, got '" + value + "'.");
    }
}

int ConfigurationManager::parseMaxTransfers(std::string const& text)
{
    std::size_t consumed = 0;
    int value = 0;
    try
    {
        value = std::stoi(text, &consumed);
    }
    catch (std::exception const&)
    {
        throw std::runtime_error("max transfers must be an integer, got '" + text + "'.");
    }

    if (consumed != text.size() || value < 0 || value > MAX_TRANSFER_CEILING)
        throw std::runtime_error("max transfers must be between 0 and " +
                                 std::to_string(MAX_TRANSFER_CEILING) + ", got '" + text + "'.");

    return value;
}

void ConfigurationManager::setDataDir(std::string dir)
{
    if (dir.empty()) throw std::runtime_error("data directory must not be empty.");
    dataDir = std::move(dir);
}

void ConfigurationManager::setMaxTransfers(int value)
{
    if (value < 0 || value > MAX_TRANSFER_CEILING)
        throw std::runtime_error("max transfers out of range: " + std::to_string(value));
    maxTransfers = value;
}

void ConfigurationManager::setParallel(bool enabled) noexcept { parallel = enabled; }

std::optional<DataFiles> ConfigurationManager::getDataFiles() const
{
    if (!dataDir) return std::nullopt;

    std::string base = *dataDir;
    if (base.back() != '/') base += '/';

    return DataFiles{base + LINES_FILE, base + TRANSFERS_FILE, base + CRIME_FILE, base + PERFORMANCE_FILE};
}

std::optional<std::string> const& ConfigurationManager::getDataDir() const noexcept { return dataDir; }
int ConfigurationManager::getMaxTransfers() const noexcept { return maxTransfers; }
bool ConfigurationManager::isParallel() const noexcept { return parallel; }
