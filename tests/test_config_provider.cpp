#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include "config/ConfigProvider.h"

namespace {

namespace fs = std::filesystem;

void clearEnv() {
    const char* names[] = {"BTCT_CONFIG",          "BTCT_PRICE_URL",   "BTCT_PAIR",         "BTCT_TIMEFRAME",
                           "BTCT_NETWORK_URL",     "BTCT_PRICE_REFRESH", "BTCT_NETWORK_REFRESH",
                           "BTCT_HTTP_TIMEOUT",    "BTCT_SETTINGS_DIR", "BTCT_WINDOW_W",    "BTCT_WINDOW_H",
                           "BTCT_LOG_LEVEL", "BTCT_LOG_FILE"};
    for (const char* name : names) {
        unsetenv(name);
    }
}

}  // namespace

int main() {
    clearEnv();

    // Defaults.
    {
        const char* argv[] = {"btcticker"};
        config::ConfigProvider provider(1, argv);
        const auto& cfg = provider.get();
        if (cfg.timeframe != "24h" || cfg.priceRefreshSec != 60 || cfg.networkRefreshSec != 120 ||
            cfg.windowWidth != 700 || cfg.windowHeight != 480 || cfg.networkApiUrl != config::kDefaultNetworkApiUrl) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
    }

    // CLI beats ENV, ENV beats file.
    {
        const auto path = fs::temp_directory_path() / "btcticker_config_test.conf";
        {
            std::ofstream out(path);
            out << "# comment\n"
                << "timeframe = month\n"
                << "pair = ETHUSD\n"
                << "priceRefreshSec = 30\n"
                << "networkRefreshSec = 90\n";
        }
        setenv("BTCT_CONFIG", path.string().c_str(), 1);
        setenv("BTCT_PRICE_REFRESH", "45", 1);
        setenv("BTCT_TIMEFRAME", "week", 1);

        const char* argv[] = {"btcticker", "--timeframe", "year", "--log-level=debug"};
        config::ConfigProvider provider(4, argv);
        const auto& cfg = provider.get();
        if (cfg.timeframe != "year") {
            std::cerr << "CLI timeframe should win, got " << cfg.timeframe << "\n";
            return 1;
        }
        if (cfg.priceRefreshSec != 45) {
            std::cerr << "ENV refresh should beat the file, got " << cfg.priceRefreshSec << "\n";
            return 1;
        }
        if (cfg.networkRefreshSec != 90 || cfg.pair != "ethusd") {
            std::cerr << "File values not applied\n";
            return 1;
        }
        if (cfg.logLevel != config::LogLevel::Debug) {
            std::cerr << "--log-level=debug not applied\n";
            return 1;
        }
        if (cfg.configFile != path.string()) {
            std::cerr << "configFile not recorded\n";
            return 1;
        }
        clearEnv();
        std::error_code ec;
        fs::remove(path, ec);
    }

    // Clamping and rejected values.
    {
        const char* argv[] = {"btcticker", "--price-refresh", "1", "-w", "10", "--timeframe=decade", "--timeout", "abc"};
        config::ConfigProvider provider(8, argv);
        const auto& cfg = provider.get();
        if (cfg.priceRefreshSec != 5) {
            std::cerr << "Refresh interval should clamp to 5, got " << cfg.priceRefreshSec << "\n";
            return 1;
        }
        if (cfg.windowWidth != 320) {
            std::cerr << "Window width should clamp to 320, got " << cfg.windowWidth << "\n";
            return 1;
        }
        if (cfg.timeframe != "24h") {
            std::cerr << "Unknown timeframe must be ignored\n";
            return 1;
        }
        if (cfg.httpTimeoutSec != 10) {
            std::cerr << "Non-numeric timeout must be ignored\n";
            return 1;
        }
    }

    // Flags.
    {
        const char* argv[] = {"btcticker", "--help", "--version"};
        config::ConfigProvider provider(3, argv);
        if (!provider.get().showHelp || !provider.get().showVersion) {
            std::cerr << "--help/--version not recognised\n";
            return 1;
        }
        if (config::ConfigProvider::parseLogLevel("WARNING") != config::LogLevel::Warn ||
            config::ConfigProvider::logLevelToString(config::LogLevel::Trace) != "trace") {
            std::cerr << "Log level conversion mismatch\n";
            return 1;
        }
    }

    return 0;
}
