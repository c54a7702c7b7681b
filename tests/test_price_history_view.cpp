#include <cstddef>
#include <iostream>
#include <utility>

#include "app/PriceHistoryView.h"
#include "app/SharedState.h"
#include "config/Config.h"
#include "logging/Log.h"
#include "FakeSources.h"

using testing_support::makeHistory;

namespace {

domain::History historyOf(std::size_t count, domain::EpochSeconds start = 1'600'000'000) {
    domain::History history;
    for (std::size_t i = 0; i < count; ++i) {
        domain::HistoryPoint point;
        point.time.raw = start + static_cast<domain::EpochSeconds>(i) * 86'400;
        const double close = 1000.0 + static_cast<double>(i);
        point.candle = domain::Candle{close, close, close, close};
        history.push_back(point);
    }
    return history;
}

void publish(app::SharedState& state, domain::History history, double price) {
    state.update([&](app::MetricSnapshot& s) {
        s.history = std::move(history);
        ++s.historyVersion;
        s.price = price;
        s.newPriceFetched = true;
    });
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    // The display buffer never exceeds capacity; appends evict the oldest.
    {
        app::SharedState state;
        app::PriceHistoryView view;
        publish(state, historyOf(app::PriceHistoryView::kCapacity), 5000.0);

        view.tick(state);
        if (view.buffer().size() != app::PriceHistoryView::kCapacity) {
            std::cerr << "Expected full buffer after append, size=" << view.buffer().size() << "\n";
            return 1;
        }
        if (view.buffer().front().time.raw != 1'600'000'000 + 86'400) {
            std::cerr << "Expected the oldest entry to be evicted\n";
            return 1;
        }
        if (view.buffer().back().candle.close != 5000.0 || view.buffer().back().candle.open != 5000.0) {
            std::cerr << "Expected the synthesized candle at the end\n";
            return 1;
        }
        if (state.snapshot().newPriceFetched) {
            std::cerr << "newPriceFetched must be cleared by the tick\n";
            return 1;
        }

        for (int i = 0; i < 5; ++i) {
            state.update([i](app::MetricSnapshot& s) {
                s.price = 6000.0 + i;
                s.newPriceFetched = true;
            });
            view.tick(state);
            if (view.buffer().size() != app::PriceHistoryView::kCapacity) {
                std::cerr << "Buffer exceeded capacity\n";
                return 1;
            }
        }
    }

    // Longer series keep only the newest entries.
    {
        app::SharedState state;
        app::PriceHistoryView view;
        const auto year = historyOf(365);
        state.update([&](app::MetricSnapshot& s) {
            s.history = year;
            ++s.historyVersion;
        });
        view.tick(state);
        if (view.buffer().size() != app::PriceHistoryView::kCapacity ||
            view.buffer().back().time.raw != year.back().time.raw) {
            std::cerr << "Expected the newest 100 candles of a 365-candle series\n";
            return 1;
        }
    }

    // Synthesized points survive ticks until the history itself is replaced.
    {
        app::SharedState state;
        app::PriceHistoryView view;
        publish(state, makeHistory({10, 11, 12}), 13.0);
        view.tick(state);
        view.tick(state);
        if (view.buffer().size() != 4) {
            std::cerr << "Expected 3 candles plus 1 synthesized point, size=" << view.buffer().size() << "\n";
            return 1;
        }
        publish(state, makeHistory({20, 21}), 21.0);
        view.tick(state);
        if (view.buffer().size() != 3 || view.buffer().front().candle.close != 20.0) {
            std::cerr << "Expected replacement plus one point after a new history\n";
            return 1;
        }
    }

    // The timeframe flag resets the view for exactly one tick.
    {
        app::SharedState state;
        app::PriceHistoryView view;
        publish(state, historyOf(10), 0.0);
        view.tick(state);

        state.update([](app::MetricSnapshot& s) {
            s.timeframe = domain::Timeframe::Month;
            s.timeframeChanged = true;
            s.history = historyOf(3, 1'700'000'000);
            ++s.historyVersion;
        });
        const auto drawn = view.tick(state);
        if (!view.viewWasReset() || !drawn.timeframeChanged) {
            std::cerr << "Expected the view reset on the first tick after a change\n";
            return 1;
        }
        if (state.snapshot().timeframeChanged) {
            std::cerr << "timeframeChanged must be cleared after one tick\n";
            return 1;
        }
        const auto& bounds = view.bounds();
        if (!bounds.valid || bounds.min != 1'700'000'000 || bounds.max != 1'700'000'000 + 2 * 86'400) {
            std::cerr << "Expected bounds recomputed from the new buffer\n";
            return 1;
        }

        view.tick(state);
        if (view.viewWasReset()) {
            std::cerr << "View reset must not repeat on the next tick\n";
            return 1;
        }
    }

    // Tick returns display values without the history payload.
    {
        app::SharedState state;
        app::PriceHistoryView view;
        publish(state, historyOf(5), 1234.5);
        state.update([](app::MetricSnapshot& s) { s.blockHeight = 800000; });
        const auto drawn = view.tick(state);
        if (drawn.price != 1234.5 || drawn.blockHeight != 800000U || !drawn.history.empty()) {
            std::cerr << "Unexpected snapshot returned by tick\n";
            return 1;
        }
    }

    return 0;
}
