#include "ui/ChartGeometry.h"

#include "core/TimeFormat.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ui {

namespace {
constexpr float kMaxCandleWidth = 14.f;
constexpr float kMinCandleWidth = 1.f;
}  // namespace

std::vector<const domain::HistoryPoint*> visiblePoints(const domain::History& history,
                                                       const app::TimeBounds& bounds) {
    std::vector<const domain::HistoryPoint*> out;
    out.reserve(history.size());
    for (const auto& point : history) {
        if (!bounds.valid || (point.time.raw >= bounds.min && point.time.raw <= bounds.max)) {
            out.push_back(&point);
        }
    }
    return out;
}

PriceRange paddedPriceRange(const std::vector<const domain::HistoryPoint*>& points, double currentPrice) {
    PriceRange range;
    for (const auto* point : points) {
        if (!range.valid) {
            range.min = point->candle.low;
            range.max = point->candle.high;
            range.valid = true;
            continue;
        }
        range.min = std::min(range.min, point->candle.low);
        range.max = std::max(range.max, point->candle.high);
    }
    if (currentPrice > 0.0) {
        if (!range.valid) {
            range.min = currentPrice;
            range.max = currentPrice;
            range.valid = true;
        }
        range.min = std::min(range.min, currentPrice);
        range.max = std::max(range.max, currentPrice);
    }
    if (!range.valid) {
        return range;
    }

    double span = range.max - range.min;
    if (span <= 0.0) {
        span = std::max(std::abs(range.max) * 0.01, 1.0);
        range.min -= span / 2.0;
        range.max += span / 2.0;
        span = range.max - range.min;
    }
    range.min = std::max(0.0, range.min - span * kPricePadding);
    range.max = range.max + span * kPricePadding;
    return range;
}

ChartGeometry::ChartGeometry(ChartArea area, app::TimeBounds time, PriceRange price)
    : area_(area),
      time_(time),
      price_(price) {}

float ChartGeometry::xFor(domain::EpochSeconds t) const {
    if (!time_.valid || time_.max <= time_.min) {
        return area_.left + area_.width / 2.f;
    }
    const double ratio = static_cast<double>(t - time_.min) / static_cast<double>(time_.max - time_.min);
    return area_.left + static_cast<float>(ratio) * area_.width;
}

float ChartGeometry::yFor(double price) const {
    if (!price_.valid || price_.max <= price_.min) {
        return area_.top + area_.height / 2.f;
    }
    const double ratio = (price - price_.min) / (price_.max - price_.min);
    return area_.bottom() - static_cast<float>(ratio) * area_.height;
}

float ChartGeometry::candleWidth(std::size_t count) const {
    if (count == 0) {
        return kMaxCandleWidth;
    }
    const float slot = area_.width / static_cast<float>(count);
    return std::clamp(slot * 0.7f, kMinCandleWidth, kMaxCandleWidth);
}

std::vector<AxisLabel> ChartGeometry::priceLabels(std::size_t count) const {
    std::vector<AxisLabel> labels;
    if (!price_.valid || count < 2) {
        return labels;
    }
    labels.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double value = price_.min + (price_.max - price_.min) * static_cast<double>(i) / static_cast<double>(count - 1);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.0f", value);
        labels.push_back(AxisLabel{yFor(value), buffer});
    }
    return labels;
}

std::vector<AxisLabel> ChartGeometry::timeLabels(std::size_t count) const {
    std::vector<AxisLabel> labels;
    if (!time_.valid || time_.max <= time_.min || count < 2) {
        return labels;
    }
    labels.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto t = time_.min + static_cast<domain::EpochSeconds>(
                                       static_cast<double>(time_.max - time_.min) * static_cast<double>(i) /
                                       static_cast<double>(count - 1));
        labels.push_back(AxisLabel{xFor(t), core::formatLocal(t, core::TimeFormat::kMinuteFormat)});
    }
    return labels;
}

}  // namespace ui
