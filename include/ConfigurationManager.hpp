#pragma once
#include <optional>
#include <string>

struct DataFiles
{
    std::string lines;
    std::string transfers;
    std::string crime;
    std::string performance;
};


class ConfigurationManager
{
private:
    std::optional<std::string> dataDir;
    int maxTransfers = 5;
    bool parallel = false;

public:
    ConfigurationManager();
    static inline const std::string LINES_FILE       = "lines.csv";
    static inline const std::string TRANSFERS_FILE   = "transfers.csv";
    static inline const std::string CRIME_FILE       = "crime.csv";
    static inline const std::string PERFORMANCE_FILE = "performance.csv";
    static inline const int MAX_TRANSFER_CEILING     = 20;

    // Command-line flags take precedence over the environment.
    void setDataDir(std::string dir);
    void setMaxTransfers(int value);
    void setParallel(bool enabled) noexcept;

    [[nodiscard]] std::optional<std::string> const& getDataDir() const noexcept;
    [[nodiscard]] std::optional<DataFiles> getDataFiles() const;
    [[nodiscard]] int getMaxTransfers() const noexcept;
    [[nodiscard]] bool isParallel() const noexcept;

    static int parseMaxTransfers(std::string const& text);
};
