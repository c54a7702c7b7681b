#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "app/RefreshCoordinator.h"
#include "app/SharedState.h"
#include "config/Config.h"
#include "core/TimeFormat.h"
#include "logging/Log.h"
#include "FakeSources.h"

using testing_support::FakeNetworkSource;
using testing_support::FakePriceSource;
using testing_support::makeHistory;
using testing_support::sameHistory;

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Switches the shared timeframe to Month while an OHLC request is in flight.
class DivertingPriceSource : public FakePriceSource {
public:
    explicit DivertingPriceSource(app::SharedState& state) : state_(state) {}

    domain::Result<domain::History> fetchOhlc(domain::Timeframe timeframe) override {
        auto result = FakePriceSource::fetchOhlc(timeframe);
        state_.update([](app::MetricSnapshot& s) {
            s.timeframe = domain::Timeframe::Month;
            s.timeframeChanged = true;
        });
        return result;
    }

private:
    app::SharedState& state_;
};

app::RefreshCoordinator makeCoordinator(app::SharedState& state,
                                        domain::PriceSource& price,
                                        FakeNetworkSource& network) {
    return app::RefreshCoordinator(state, price, network, []() { return std::string("https://mempool.example/api"); });
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    // Each successful OHLC fetch replaces the stored history wholesale.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);

        const auto first = makeHistory({100, 101, 102, 103});
        const auto second = makeHistory({200, 201}, 1'710'000'000);
        price.queuePrice(domain::Result<double>::success(103.5));
        price.queueOhlc(domain::Result<domain::History>::success(first));
        price.queueOhlc(domain::Result<domain::History>::success(second));

        coordinator.refreshPriceAndHistory();
        auto snap = state.snapshot();
        if (!sameHistory(snap.history, first) || snap.historyVersion != 1) {
            std::cerr << "Expected first fetch to be stored verbatim\n";
            return 1;
        }

        coordinator.refreshPriceAndHistory();
        snap = state.snapshot();
        if (!sameHistory(snap.history, second) || snap.historyVersion != 2) {
            std::cerr << "Expected second fetch to replace history (size=" << snap.history.size() << ")\n";
            return 1;
        }
        if (snap.updating || snap.price != 103.5 || !snap.newPriceFetched || snap.priceIsFallback) {
            std::cerr << "Unexpected price state after successful refreshes\n";
            return 1;
        }
    }

    // A failed OHLC fetch leaves history untouched.
    {
        app::SharedState state(domain::Timeframe::Week);
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);

        const auto history = makeHistory({10, 11, 12});
        price.queuePrice(domain::Result<double>::success(12.0));
        price.queueOhlc(domain::Result<domain::History>::success(history));
        price.queueOhlc(domain::Result<domain::History>::failure(domain::ErrorKind::Status, "HTTP 503"));

        coordinator.refreshPriceAndHistory();
        coordinator.refreshPriceAndHistory();
        const auto snap = state.snapshot();
        if (!sameHistory(snap.history, history) || snap.historyVersion != 1) {
            std::cerr << "Expected history to survive a failed OHLC fetch\n";
            return 1;
        }
        const auto requested = price.timeframes();
        if (requested.size() != 2 || requested[0] != domain::Timeframe::Week) {
            std::cerr << "Expected OHLC requests for the active timeframe\n";
            return 1;
        }
    }

    // Price failure falls back to the last close and marks the timestamp.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);

        state.update([](app::MetricSnapshot& s) {
            s.history = makeHistory({50, 60, 70.25});
            s.price = 99.0;
        });
        price.queuePrice(domain::Result<double>::failure(domain::ErrorKind::Transport, "timeout"));
        price.queueOhlc(domain::Result<domain::History>::failure(domain::ErrorKind::Transport, "timeout"));

        coordinator.refreshPriceAndHistory();
        const auto snap = state.snapshot();
        if (snap.price != 70.25) {
            std::cerr << "Expected fallback price 70.25, got " << snap.price << "\n";
            return 1;
        }
        if (!endsWith(snap.lastUpdated, core::TimeFormat::kFallbackMarker) || !snap.priceIsFallback) {
            std::cerr << "Expected fallback marker in '" << snap.lastUpdated << "'\n";
            return 1;
        }
        if (snap.updating) {
            std::cerr << "updating must be cleared after a failed price fetch\n";
            return 1;
        }
        if (price.ohlcCalls.load() != 1) {
            std::cerr << "Expected the OHLC fetch to run even after a price failure\n";
            return 1;
        }
    }

    // Price failure without history keeps the placeholder values.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);
        coordinator.refreshPriceAndHistory();
        const auto snap = state.snapshot();
        if (snap.price != 0.0 || snap.lastUpdated != app::kNeverUpdated || snap.updating) {
            std::cerr << "Expected untouched placeholders without history\n";
            return 1;
        }
    }

    // An unchanged price does not request a new chart point.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);
        state.update([](app::MetricSnapshot& s) { s.price = 42.0; });
        price.queuePrice(domain::Result<double>::success(42.0));

        coordinator.refreshPriceAndHistory();
        const auto snap = state.snapshot();
        if (snap.newPriceFetched) {
            std::cerr << "Unchanged price must not set newPriceFetched\n";
            return 1;
        }
        if (snap.lastUpdated == app::kNeverUpdated) {
            std::cerr << "Expected lastUpdated to be refreshed\n";
            return 1;
        }
    }

    // Concurrent refreshes with different outcomes never leave updating stuck.
    {
        app::SharedState state;
        FakePriceSource slowOk;
        FakePriceSource fastFail;
        FakeNetworkSource network;
        state.update([](app::MetricSnapshot& s) { s.history = makeHistory({1, 2, 3}); });

        slowOk.setPriceDelay(std::chrono::milliseconds(60));
        slowOk.queuePrice(domain::Result<double>::success(500.0));
        fastFail.queuePrice(domain::Result<double>::failure(domain::ErrorKind::Transport, "refused"));

        auto timer = makeCoordinator(state, slowOk, network);
        auto manual = makeCoordinator(state, fastFail, network);

        std::thread a([&]() { timer.refreshPriceAndHistory(); });
        std::thread b([&]() { manual.refreshPriceAndHistory(); });
        a.join();
        b.join();

        const auto snap = state.snapshot();
        if (snap.updating) {
            std::cerr << "updating left true after concurrent refreshes\n";
            return 1;
        }
        // The slow success completes last and wins.
        if (snap.price != 500.0 || snap.priceIsFallback) {
            std::cerr << "Expected last writer (success) to win, price=" << snap.price << "\n";
            return 1;
        }
    }

    // A timeframe switch during the price fetch redirects the OHLC fetch.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);

        price.setPriceDelay(std::chrono::milliseconds(300));
        price.queuePrice(domain::Result<double>::success(64'000.0));
        price.queueOhlc(domain::Result<domain::History>::success(makeHistory({7, 8, 9})));

        std::thread tick([&]() { coordinator.refreshPriceAndHistory(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        state.update([](app::MetricSnapshot& s) {
            s.timeframe = domain::Timeframe::Week;
            s.timeframeChanged = true;
        });
        tick.join();

        const auto requested = price.timeframes();
        if (requested.size() != 1 || requested[0] != domain::Timeframe::Week) {
            std::cerr << "Expected the OHLC fetch to use the newly selected timeframe\n";
            return 1;
        }
        const auto snap = state.snapshot();
        if (snap.timeframe != domain::Timeframe::Week || snap.history.size() != 3 || snap.historyVersion != 1) {
            std::cerr << "Expected Week candles stored under the Week timeframe\n";
            return 1;
        }
    }

    // Candles fetched for a timeframe that is no longer active are dropped.
    {
        app::SharedState state;
        DivertingPriceSource price(state);
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);
        price.queueOhlc(domain::Result<domain::History>::success(makeHistory({5, 6, 7, 8})));
        state.update([](app::MetricSnapshot& s) { s.history = makeHistory({1, 2}); });

        coordinator.refreshPriceAndHistory();
        const auto snap = state.snapshot();
        if (snap.history.size() != 2 || snap.historyVersion != 0) {
            std::cerr << "Stale 24h candles replaced the history after a switch to month\n";
            return 1;
        }
    }

    // Network metrics: partial success, mempoolUpdating always cleared.
    {
        app::SharedState state;
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);

        domain::BlockInfo block;
        block.height = 871234;
        block.timestamp = 1'731'000'000;
        network.block = domain::Result<domain::BlockInfo>::success(block);

        coordinator.refreshNetworkMetrics();
        auto snap = state.snapshot();
        if (snap.blockHeight != 871234U || snap.blockTime == app::kUnknownBlockTime) {
            std::cerr << "Expected block info stored despite fee failure\n";
            return 1;
        }
        if (snap.mempoolLastUpdated != app::kNeverUpdated || snap.mempoolUpdating) {
            std::cerr << "Fee failure must not touch mempoolLastUpdated and must clear mempoolUpdating\n";
            return 1;
        }

        network.block = domain::Result<domain::BlockInfo>::failure(domain::ErrorKind::Transport, "down");
        domain::FeeEstimate fees{20, 15, 10, 5, 1};
        network.fees = domain::Result<domain::FeeEstimate>::success(fees);
        coordinator.refreshNetworkMetrics();
        snap = state.snapshot();
        if (snap.blockHeight != 871234U || snap.fees.fastest != 20U || snap.fees.minimum != 1U) {
            std::cerr << "Expected fees stored and block height retained\n";
            return 1;
        }
        if (snap.mempoolLastUpdated == app::kNeverUpdated || snap.mempoolUpdating) {
            std::cerr << "Fee success must stamp mempoolLastUpdated\n";
            return 1;
        }
        for (const auto& url : network.urls()) {
            if (url != "https://mempool.example/api") {
                std::cerr << "Unexpected endpoint " << url << "\n";
                return 1;
            }
        }
    }

    // Bootstrap seeds history and price from the 24h series.
    {
        app::SharedState state(domain::Timeframe::Month);
        FakePriceSource price;
        FakeNetworkSource network;
        auto coordinator = makeCoordinator(state, price, network);
        const auto history = makeHistory({300, 310, 320});
        price.queueOhlc(domain::Result<domain::History>::success(history));

        coordinator.bootstrapHistory();
        const auto snap = state.snapshot();
        if (!sameHistory(snap.history, history) || snap.price != 320.0 || snap.lastUpdated == app::kNeverUpdated) {
            std::cerr << "Bootstrap did not seed history and price\n";
            return 1;
        }
        const auto requested = price.timeframes();
        if (requested.size() != 1 || requested[0] != domain::Timeframe::Hours24) {
            std::cerr << "Bootstrap must fetch the 24h series\n";
            return 1;
        }
    }

    return 0;
}
