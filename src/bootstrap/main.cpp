#include "app/Application.h"
#include "app/CommandDispatcher.h"
#include "app/RefreshCoordinator.h"
#include "app/RefreshScheduler.h"
#include "app/SharedState.h"
#include "app/Shutdown.h"
#include "config/ConfigProvider.h"
#include "config/EndpointUrl.h"
#include "config/SettingsStore.h"
#include "infra/exchange/BitstampGateway.h"
#include "infra/exchange/MempoolGateway.h"
#include "logging/Log.h"

#include <chrono>
#include <exception>
#include <iostream>

namespace bootstrap {
namespace {
void printHelp(const config::Config& defaults) {
    std::cout << "Usage: btcticker [options]\n"
              << "  -t, --timeframe TF          24h|week|month|year (default: " << defaults.timeframe << ")\n"
              << "  -p, --pair PAIR             (default: " << defaults.pair << ")\n"
              << "      --price-url URL         (default: " << defaults.priceApiUrl << ")\n"
              << "      --network-url URL       default block explorer API (default: " << defaults.networkApiUrl << ")\n"
              << "      --price-refresh SEC     (default: " << defaults.priceRefreshSec << ")\n"
              << "      --network-refresh SEC   (default: " << defaults.networkRefreshSec << ")\n"
              << "      --timeout SEC           HTTP timeout (default: " << defaults.httpTimeoutSec << ")\n"
              << "      --settings-dir PATH     directory holding config.json\n"
              << "      --config FILE           key=value file (timeframe=..., pair=..., etc.)\n"
              << "  -w, --window-width N        (default: " << defaults.windowWidth << ")\n"
              << "  -h, --window-height N       (default: " << defaults.windowHeight << ")\n"
              << "  -l, --log-level LEVEL       trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --log-file FILE         append log lines to FILE instead of stderr\n"
              << "      --help                  show this help\n"
              << "      --version               show the version\n"
              << "Environment: BTCT_PRICE_URL, BTCT_PAIR, BTCT_TIMEFRAME, BTCT_NETWORK_URL, BTCT_PRICE_REFRESH,\n"
              << "             BTCT_NETWORK_REFRESH, BTCT_HTTP_TIMEOUT, BTCT_SETTINGS_DIR, BTCT_CONFIG,\n"
              << "             BTCT_WINDOW_W, BTCT_WINDOW_H, BTCT_LOG_LEVEL, BTCT_LOG_FILE\n"
              << "Precedence: CLI > ENV > file > defaults\n";
}

void printVersion() {
#ifdef PROJECT_NAME
    std::cout << PROJECT_NAME;
#else
    std::cout << "btcticker";
#endif
#ifdef PROJECT_VERSION
    std::cout << ' ' << PROJECT_VERSION;
#endif
    std::cout << '\n';
}
}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        printHelp(config::Config{});
        return 0;
    }

    if (config.showVersion) {
        printVersion();
        return 0;
    }

    logging::Log::SetGlobalLogLevel(config.logLevel);
    const bool logToFile = !config.logFile.empty() && logging::Log::open_file(config.logFile);
    LOG_INFO(logging::LogCategory::CONFIG,
             "Startup level=%s timeframe=%s pair=%s log=%s",
             logging::Log::level_to_string(config.logLevel),
             config.timeframe.c_str(),
             config.pair.c_str(),
             logToFile ? config.logFile.c_str() : "stderr");

    std::string defaultEndpoint = config.networkApiUrl;
    if (auto normalized = config::normalizeEndpointUrl(defaultEndpoint)) {
        defaultEndpoint = *normalized;
    }
    else {
        LOG_WARN(logging::LogCategory::CONFIG,
                 "Invalid network URL '%s', using %s",
                 config.networkApiUrl.c_str(),
                 config::kDefaultNetworkApiUrl);
        defaultEndpoint = config::kDefaultNetworkApiUrl;
    }

    config::SettingsStore settings(config.settingsDir, defaultEndpoint);
    settings.load();

    infra::exchange::BitstampGatewayConfig priceCfg;
    priceCfg.baseUrl = config.priceApiUrl;
    priceCfg.pair = config.pair;
    priceCfg.timeoutSec = config.httpTimeoutSec;
    infra::exchange::BitstampGateway priceGateway(priceCfg);

    infra::exchange::MempoolGatewayConfig networkCfg;
    networkCfg.timeoutSec = config.httpTimeoutSec;
    infra::exchange::MempoolGateway networkGateway(networkCfg);

    const auto initialTimeframe = domain::timeframe_from_label(config.timeframe).value_or(domain::Timeframe::Hours24);
    app::SharedState state(initialTimeframe);
    app::RefreshCoordinator coordinator(state, priceGateway, networkGateway, [&settings]() {
        return settings.activeEndpoint();
    });

    app::SchedulerConfig schedulerCfg;
    schedulerCfg.priceInterval = std::chrono::seconds(config.priceRefreshSec);
    schedulerCfg.networkInterval = std::chrono::seconds(config.networkRefreshSec);
    app::RefreshScheduler scheduler(coordinator, schedulerCfg);

    app::CommandDispatcher dispatcher(coordinator, state, &settings);
    dispatcher.start();
    scheduler.start();

    bool quit = false;
    try {
        app::Application application(config, state, dispatcher, settings);
        application.run();
        quit = true;
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::UI, "Application failed: %s", ex.what());
    }

    // Quit or a closed window ends the process without waiting on the network.
    if (quit) {
        app::exitImmediately(dispatcher, scheduler, 0);
    }

    LOG_INFO(logging::LogCategory::STATE, "Shutting down after failure");
    dispatcher.stop();
    scheduler.stop();
    logging::Log::close_file();
    return 1;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    return bootstrap::run(argc, argv);
}
