#include "app/RefreshCoordinator.h"

#include "core/TimeFormat.h"
#include "logging/Log.h"

#include <utility>

namespace app {

RefreshCoordinator::RefreshCoordinator(SharedState& state,
                                       domain::PriceSource& priceSource,
                                       domain::NetworkSource& networkSource,
                                       EndpointProvider networkEndpoint)
    : state_(state),
      priceSource_(priceSource),
      networkSource_(networkSource),
      networkEndpoint_(std::move(networkEndpoint)) {}

void RefreshCoordinator::refreshPriceAndHistory() {
    LOG_DEBUG(logging::LogCategory::STATE, "Refreshing price and history");
    refreshPrice();
    refreshHistory();
}

void RefreshCoordinator::refreshPrice() {
    state_.update([](MetricSnapshot& s) { s.updating = true; });

    const auto result = priceSource_.fetchCurrentPrice();
    const std::string now = core::currentTimestamp();

    if (result.ok) {
        const bool changed = state_.update([&](MetricSnapshot& s) {
            const bool differs = s.price != result.value;
            if (differs) {
                s.newPriceFetched = true;
            }
            s.price = result.value;
            s.lastUpdated = now;
            s.priceIsFallback = false;
            s.updating = false;
            return differs;
        });
        LOG_INFO(logging::LogCategory::STATE,
                 "Price updated: $%.2f%s",
                 result.value,
                 changed ? "" : " (unchanged)");
        return;
    }

    LOG_WARN(logging::LogCategory::STATE,
             "Failed to fetch BTC price (%s): %s",
             domain::error_kind_to_string(result.kind),
             result.error.c_str());

    bool usedFallback = false;
    double fallback = 0.0;
    state_.update([&](MetricSnapshot& s) {
        s.updating = false;
        if (!s.history.empty()) {
            fallback = s.history.back().candle.close;
            s.price = fallback;
            s.lastUpdated = now + core::TimeFormat::kFallbackMarker;
            s.priceIsFallback = true;
            usedFallback = true;
        }
    });
    if (usedFallback) {
        LOG_INFO(logging::LogCategory::STATE, "Using last historical close as fallback: $%.2f", fallback);
    }
}

void RefreshCoordinator::refreshHistory() {
    const domain::Timeframe timeframe = state_.timeframe();
    auto result = priceSource_.fetchOhlc(timeframe);
    if (result.failed()) {
        LOG_WARN(logging::LogCategory::STATE,
                 "Failed to fetch historical data for %s (%s): %s",
                 domain::timeframe_label(timeframe),
                 domain::error_kind_to_string(result.kind),
                 result.error.c_str());
        return;
    }

    const std::size_t count = result.value.size();
    const bool stored = state_.update([&](MetricSnapshot& s) {
        if (s.timeframe != timeframe) {
            return false;
        }
        s.history = std::move(result.value);
        ++s.historyVersion;
        s.newPriceFetched = true;
        return true;
    });
    if (!stored) {
        LOG_DEBUG(logging::LogCategory::STATE,
                  "Discarding %s candles, timeframe changed during fetch",
                  domain::timeframe_label(timeframe));
        return;
    }
    LOG_INFO(logging::LogCategory::STATE,
             "History replaced: %zu candles (%s)",
             count,
             domain::timeframe_label(timeframe));
}

void RefreshCoordinator::refreshNetworkMetrics() {
    const std::string endpoint = networkEndpoint_ ? networkEndpoint_() : std::string{};
    LOG_DEBUG(logging::LogCategory::STATE, "Refreshing network metrics from %s", endpoint.c_str());

    state_.update([](MetricSnapshot& s) { s.mempoolUpdating = true; });

    const auto block = networkSource_.fetchLatestBlock(endpoint);
    if (block.ok) {
        const std::string blockTime =
            core::formatLocal(block.value.timestamp, core::TimeFormat::kMinuteFormat);
        state_.update([&](MetricSnapshot& s) {
            s.blockHeight = block.value.height;
            s.blockTime = blockTime;
        });
        LOG_INFO(logging::LogCategory::STATE, "Block height updated: %u", block.value.height);
    }
    else {
        LOG_WARN(logging::LogCategory::STATE,
                 "Failed to fetch block info (%s): %s",
                 domain::error_kind_to_string(block.kind),
                 block.error.c_str());
    }

    const auto fees = networkSource_.fetchFeeEstimate(endpoint);
    if (fees.ok) {
        const std::string now = core::currentTimestamp();
        state_.update([&](MetricSnapshot& s) {
            s.fees = fees.value;
            s.mempoolLastUpdated = now;
            s.mempoolUpdating = false;
        });
        LOG_INFO(logging::LogCategory::STATE, "Fee estimates updated: fastest=%u sat/vB", fees.value.fastest);
    }
    else {
        state_.update([](MetricSnapshot& s) { s.mempoolUpdating = false; });
        LOG_WARN(logging::LogCategory::STATE,
                 "Failed to fetch fee estimates (%s): %s",
                 domain::error_kind_to_string(fees.kind),
                 fees.error.c_str());
    }
}

void RefreshCoordinator::bootstrapHistory() {
    LOG_INFO(logging::LogCategory::STATE, "Fetching initial 24h history");
    auto result = priceSource_.fetchOhlc(domain::Timeframe::Hours24);
    if (result.failed()) {
        LOG_WARN(logging::LogCategory::STATE,
                 "Initial history unavailable (%s): %s",
                 domain::error_kind_to_string(result.kind),
                 result.error.c_str());
        return;
    }
    if (result.value.empty()) {
        LOG_WARN(logging::LogCategory::STATE, "Initial history is empty");
        return;
    }

    const double seed = result.value.back().candle.close;
    const std::string now = core::currentTimestamp();
    const std::size_t count = result.value.size();
    state_.update([&](MetricSnapshot& s) {
        s.history = std::move(result.value);
        ++s.historyVersion;
        s.price = seed;
        s.lastUpdated = now;
        s.newPriceFetched = true;
    });
    LOG_INFO(logging::LogCategory::STATE, "Seeded %zu candles, price $%.2f", count, seed);
}

}  // namespace app
