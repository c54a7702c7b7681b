#include <cmath>
#include <iostream>
#include <string>

#include "app/SharedState.h"
#include "ui/ChartGeometry.h"
#include "ui/MetricFormat.h"

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

domain::HistoryPoint point(domain::EpochSeconds t, double low, double high) {
    domain::HistoryPoint p;
    p.time.raw = t;
    p.candle = domain::Candle{low, high, low, high};
    return p;
}

}  // namespace

int main() {
    // Range covers the candles and the current price, padded 5% per side.
    {
        const domain::History history{point(10, 100.0, 150.0), point(20, 120.0, 200.0)};
        const auto visible = ui::visiblePoints(history, app::TimeBounds{0, 100, true});
        const auto range = ui::paddedPriceRange(visible, 150.0);
        if (!range.valid || !near(range.min, 95.0) || !near(range.max, 205.0)) {
            std::cerr << "Unexpected padded range " << range.min << ".." << range.max << "\n";
            return 1;
        }

        const auto withSpike = ui::paddedPriceRange(visible, 300.0);
        if (!near(withSpike.max, 310.0)) {
            std::cerr << "Current price must widen the range, max=" << withSpike.max << "\n";
            return 1;
        }
    }

    // The lower edge never goes below zero.
    {
        const domain::History history{point(1, 1.0, 100.0)};
        const auto range = ui::paddedPriceRange(ui::visiblePoints(history, app::TimeBounds{}), 0.0);
        if (range.min != 0.0 || !near(range.max, 104.95)) {
            std::cerr << "Expected min clamped to 0, got " << range.min << "\n";
            return 1;
        }
    }

    // A flat series still gets a non-empty range.
    {
        const domain::History history{point(1, 1000.0, 1000.0), point(2, 1000.0, 1000.0)};
        const auto range = ui::paddedPriceRange(ui::visiblePoints(history, app::TimeBounds{}), 1000.0);
        if (!(range.max > range.min) || !near(range.min, 994.5) || !near(range.max, 1005.5)) {
            std::cerr << "Unexpected flat range " << range.min << ".." << range.max << "\n";
            return 1;
        }
        if (ui::paddedPriceRange({}, 0.0).valid) {
            std::cerr << "No data and no price must give an invalid range\n";
            return 1;
        }
    }

    // Points outside the time bounds are skipped.
    {
        const domain::History history{point(5, 1, 2), point(50, 1, 2), point(500, 1, 2)};
        const auto visible = ui::visiblePoints(history, app::TimeBounds{10, 100, true});
        if (visible.size() != 1 || visible.front()->time.raw != 50) {
            std::cerr << "visiblePoints did not filter by bounds\n";
            return 1;
        }
    }

    // Pixel mapping.
    {
        const ui::ChartArea area{10.f, 20.f, 200.f, 100.f};
        const ui::ChartGeometry geometry(area, app::TimeBounds{0, 100, true}, ui::PriceRange{0.0, 100.0, true});
        if (!near(geometry.xFor(50), 110.0) || !near(geometry.xFor(0), 10.0) || !near(geometry.xFor(100), 210.0)) {
            std::cerr << "xFor mapping is off\n";
            return 1;
        }
        if (!near(geometry.yFor(25.0), 95.0) || !near(geometry.yFor(100.0), 20.0)) {
            std::cerr << "yFor mapping is off\n";
            return 1;
        }
        if (geometry.candleWidth(1) != 14.f || geometry.candleWidth(1000) != 1.f) {
            std::cerr << "candleWidth not clamped\n";
            return 1;
        }
        const auto labels = geometry.priceLabels(5);
        if (labels.size() != 5 || labels.front().text != "0" || labels.back().text != "100") {
            std::cerr << "Unexpected price labels\n";
            return 1;
        }
        if (geometry.timeLabels(4).size() != 4) {
            std::cerr << "Expected 4 time labels\n";
            return 1;
        }
    }

    // Display strings.
    {
        if (ui::formatPriceHeadline(0.0) != "Loading...") {
            std::cerr << "Unset price should read Loading...\n";
            return 1;
        }
        if (ui::formatPriceHeadline(50000.0) != "$50000.00 | 2000 sats/$") {
            std::cerr << "Unexpected headline: " << ui::formatPriceHeadline(50000.0) << "\n";
            return 1;
        }
        if (ui::formatCurrentPriceLabel(123.456) != "Current Price: $123.46") {
            std::cerr << "Unexpected current price label\n";
            return 1;
        }

        app::MetricSnapshot snapshot;
        if (ui::formatBlockLine(snapshot) != "Block Height: 0  |  Block Time: Unknown  |  Last Updated: Never") {
            std::cerr << "Unexpected placeholder block line: " << ui::formatBlockLine(snapshot) << "\n";
            return 1;
        }
        snapshot.lastUpdated = "2026-01-01 10:00:00* (fallback)";
        snapshot.updating = true;
        if (ui::formatLastUpdated(snapshot) != "Last updated: 2026-01-01 10:00:00* (fallback)  (updating...)") {
            std::cerr << "Unexpected last-updated line\n";
            return 1;
        }
        snapshot.fees = domain::FeeEstimate{20, 15, 10, 5, 1};
        if (ui::formatFeeLine(snapshot) !=
            "Fees (sat/vB):  Fastest: 20  |  30m: 15  |  1h: 10  |  Economy: 5  |  Minimum: 1") {
            std::cerr << "Unexpected fee line\n";
            return 1;
        }
    }

    return 0;
}
