#pragma once

#include <cstdint>
#include <string>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

inline bool logLevelAtLeast(LogLevel level, LogLevel threshold) {
    return logLevelSeverity(level) <= logLevelSeverity(threshold);
}

inline constexpr const char* kDefaultPriceApiUrl = "https://www.bitstamp.net/api/v2";
inline constexpr const char* kDefaultNetworkApiUrl = "https://mempool.space/api";

struct Config {
    // market
    std::string priceApiUrl      = kDefaultPriceApiUrl;
    std::string pair             = "btcusd";
    std::string timeframe        = "24h";

    // network metrics
    std::string networkApiUrl    = kDefaultNetworkApiUrl;

    // refresh cadence
    int priceRefreshSec          = 60;
    int networkRefreshSec        = 120;
    int httpTimeoutSec           = 10;

    // IO / paths
    std::string settingsDir      = "";
    std::string configFile       = "";

    // UI
    int windowWidth              = 700;
    int windowHeight             = 480;

    // logs
    LogLevel logLevel            = LogLevel::Info;
    std::string logFile          = "";

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace config
