#include "config/ConfigProvider.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace config {

namespace {
constexpr int kMinWindowSize = 320;
constexpr int kMinRefreshSec = 5;
constexpr int kMinTimeoutSec = 1;

struct EnvBinding {
    const char* env;
    const char* key;
};

constexpr std::array<EnvBinding, 12> kEnvBindings{{
    {"BTCT_PRICE_URL", "priceApiUrl"},
    {"BTCT_PAIR", "pair"},
    {"BTCT_TIMEFRAME", "timeframe"},
    {"BTCT_NETWORK_URL", "networkApiUrl"},
    {"BTCT_PRICE_REFRESH", "priceRefreshSec"},
    {"BTCT_NETWORK_REFRESH", "networkRefreshSec"},
    {"BTCT_HTTP_TIMEOUT", "httpTimeoutSec"},
    {"BTCT_SETTINGS_DIR", "settingsDir"},
    {"BTCT_WINDOW_W", "windowWidth"},
    {"BTCT_WINDOW_H", "windowHeight"},
    {"BTCT_LOG_LEVEL", "logLevel"},
    {"BTCT_LOG_FILE", "logFile"},
}};

struct CliBinding {
    const char* longName;
    const char* shortName;
    const char* key;
};

constexpr std::array<CliBinding, 12> kCliBindings{{
    {"--price-url", nullptr, "priceApiUrl"},
    {"--pair", "-p", "pair"},
    {"--timeframe", "-t", "timeframe"},
    {"--network-url", nullptr, "networkApiUrl"},
    {"--price-refresh", nullptr, "priceRefreshSec"},
    {"--network-refresh", nullptr, "networkRefreshSec"},
    {"--timeout", nullptr, "httpTimeoutSec"},
    {"--settings-dir", nullptr, "settingsDir"},
    {"--window-width", "-w", "windowWidth"},
    {"--window-height", "-h", "windowHeight"},
    {"--log-level", "-l", "logLevel"},
    {"--log-file", nullptr, "logFile"},
}};

bool isKnownTimeframe(const std::string& value) {
    return value == "24h" || value == "week" || value == "month" || value == "year";
}
}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    std::string path = cliConfigPath;
    if (path.empty()) {
        if (const char* envCfg = std::getenv("BTCT_CONFIG")) {
            path = envCfg;
        }
    }

    if (!path.empty()) {
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    switch (l) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

bool ConfigProvider::apply_(const std::string& key, const std::string& value, const char* origin) {
    auto applyInt = [&](int& field, int minimum) {
        int parsed{};
        if (parseInt_(value, parsed)) {
            field = std::max(parsed, minimum);
        }
        else {
            std::fprintf(stderr, "Invalid %s value for %s: %s\n", origin, key.c_str(), value.c_str());
        }
    };

    if (key == "priceApiUrl") {
        cfg_.priceApiUrl = value;
    }
    else if (key == "pair") {
        cfg_.pair = lowercase_(value);
    }
    else if (key == "timeframe") {
        const std::string lower = lowercase_(value);
        if (isKnownTimeframe(lower)) {
            cfg_.timeframe = lower;
        }
        else {
            std::fprintf(stderr, "Invalid %s value for timeframe: %s\n", origin, value.c_str());
        }
    }
    else if (key == "networkApiUrl") {
        cfg_.networkApiUrl = value;
    }
    else if (key == "priceRefreshSec") {
        applyInt(cfg_.priceRefreshSec, kMinRefreshSec);
    }
    else if (key == "networkRefreshSec") {
        applyInt(cfg_.networkRefreshSec, kMinRefreshSec);
    }
    else if (key == "httpTimeoutSec") {
        applyInt(cfg_.httpTimeoutSec, kMinTimeoutSec);
    }
    else if (key == "settingsDir") {
        cfg_.settingsDir = value;
    }
    else if (key == "windowWidth") {
        applyInt(cfg_.windowWidth, kMinWindowSize);
    }
    else if (key == "windowHeight") {
        applyInt(cfg_.windowHeight, kMinWindowSize);
    }
    else if (key == "logLevel") {
        cfg_.logLevel = parseLogLevel(value);
    }
    else if (key == "logFile") {
        cfg_.logFile = value;
    }
    else {
        return false;
    }
    return true;
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            cfg_.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg_.showVersion = true;
            continue;
        }
        if (arg == "--config") {
            takeNext(arg.c_str());
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }

        bool matched = false;
        for (const auto& binding : kCliBindings) {
            const std::string longName(binding.longName);
            if (arg == longName || (binding.shortName && arg == binding.shortName)) {
                if (auto next = takeNext(arg.c_str())) {
                    apply_(binding.key, *next, "CLI");
                }
                matched = true;
                break;
            }
            const std::string prefix = longName + "=";
            if (arg.rfind(prefix, 0) == 0) {
                apply_(binding.key, arg.substr(prefix.size()), "CLI");
                matched = true;
                break;
            }
        }

        if (!matched) {
            std::fprintf(stderr, "Unknown option ignored: %s\n", arg.c_str());
        }
    }
}

void ConfigProvider::parseEnv_() {
    for (const auto& binding : kEnvBindings) {
        if (const char* value = std::getenv(binding.env)) {
            apply_(binding.key, value, "ENV");
        }
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Unable to open config file: %s\n", path.c_str());
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim_(line.substr(0, pos));
        std::string value = trim_(line.substr(pos + 1));

        if (!apply_(key, value, "file")) {
            std::fprintf(stderr, "Unknown config key in %s: %s\n", path.c_str(), key.c_str());
        }
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace config
