#include "app/PriceHistoryView.h"

#include "core/TimeFormat.h"
#include "logging/Log.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace app {

MetricSnapshot PriceHistoryView::tick(SharedState& state) {
    bool appendPoint = false;
    bool resetView = false;
    bool replaced = false;

    MetricSnapshot view = state.update([&](MetricSnapshot& s) {
        if (s.historyVersion != seenVersion_) {
            const std::size_t skip = s.history.size() > kCapacity ? s.history.size() - kCapacity : 0;
            buffer_.assign(std::next(s.history.begin(), static_cast<std::ptrdiff_t>(skip)), s.history.end());
            seenVersion_ = s.historyVersion;
            replaced = true;
        }

        appendPoint = s.newPriceFetched;
        s.newPriceFetched = false;
        resetView = s.timeframeChanged;
        s.timeframeChanged = false;

        MetricSnapshot copy;
        copy.price = s.price;
        copy.lastUpdated = s.lastUpdated;
        copy.priceIsFallback = s.priceIsFallback;
        copy.historyVersion = s.historyVersion;
        copy.timeframe = s.timeframe;
        copy.blockHeight = s.blockHeight;
        copy.blockTime = s.blockTime;
        copy.fees = s.fees;
        copy.mempoolLastUpdated = s.mempoolLastUpdated;
        copy.updating = s.updating;
        copy.mempoolUpdating = s.mempoolUpdating;
        copy.newPriceFetched = appendPoint;
        copy.timeframeChanged = resetView;
        return copy;
    });

    if (replaced) {
        LOG_DEBUG(logging::LogCategory::RENDER, "Display buffer replaced (%zu candles)", buffer_.size());
    }
    if (appendPoint && view.price > 0.0) {
        append(view.price, core::nowEpochSeconds());
    }

    viewWasReset_ = resetView;
    if (resetView || replaced || !bounds_.valid) {
        recomputeBounds();
        if (resetView) {
            LOG_DEBUG(logging::LogCategory::RENDER,
                      "View reset for %s",
                      domain::timeframe_label(view.timeframe));
        }
    }
    else {
        extendBounds();
    }
    return view;
}

void PriceHistoryView::append(double price, domain::EpochSeconds now) {
    domain::HistoryPoint point;
    point.time = core::makeTimeInfo(now);
    point.candle = domain::Candle{price, price, price, price};
    buffer_.push_back(std::move(point));

    while (buffer_.size() > kCapacity) {
        buffer_.erase(buffer_.begin());
    }
}

void PriceHistoryView::recomputeBounds() {
    if (buffer_.empty()) {
        bounds_ = TimeBounds{};
        return;
    }
    const auto [lo, hi] = std::minmax_element(buffer_.begin(), buffer_.end(), [](const auto& a, const auto& b) {
        return a.time.raw < b.time.raw;
    });
    bounds_.min = lo->time.raw;
    bounds_.max = hi->time.raw;
    bounds_.valid = true;
}

void PriceHistoryView::extendBounds() {
    for (const auto& point : buffer_) {
        bounds_.max = std::max(bounds_.max, point.time.raw);
    }
}

}  // namespace app
