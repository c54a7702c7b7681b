#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "app/PriceHistoryView.h"
#include "domain/Types.h"

namespace ui {

struct ChartArea {
    float left{0.f};
    float top{0.f};
    float width{0.f};
    float height{0.f};

    float right() const { return left + width; }
    float bottom() const { return top + height; }
};

struct PriceRange {
    double min{0.0};
    double max{0.0};
    bool valid{false};
};

struct AxisLabel {
    float position{0.f};
    std::string text;
};

// Fraction of the price span added above and below the data.
inline constexpr double kPricePadding = 0.05;

// Points of `history` whose time lies inside `bounds`, in order.
std::vector<const domain::HistoryPoint*> visiblePoints(const domain::History& history, const app::TimeBounds& bounds);

// Low/high of the visible candles, widened to include currentPrice when it
// is positive, then padded by kPricePadding. The lower edge never drops
// below zero; a flat series gets a 1% band.
PriceRange paddedPriceRange(const std::vector<const domain::HistoryPoint*>& points, double currentPrice);

// Maps time and price into pixel space of one chart area.
class ChartGeometry {
public:
    ChartGeometry(ChartArea area, app::TimeBounds time, PriceRange price);

    float xFor(domain::EpochSeconds t) const;
    float yFor(double price) const;
    // Body width for n evenly spaced candles, clamped to [1, 14] px.
    float candleWidth(std::size_t count) const;

    std::vector<AxisLabel> priceLabels(std::size_t count) const;
    std::vector<AxisLabel> timeLabels(std::size_t count) const;

    const ChartArea& area() const { return area_; }

private:
    ChartArea area_;
    app::TimeBounds time_;
    PriceRange price_;
};

}  // namespace ui
