#pragma once

#include <cstddef>
#include <cstdint>

#include "app/SharedState.h"
#include "domain/Types.h"

namespace app {

struct TimeBounds {
    domain::EpochSeconds min{0};
    domain::EpochSeconds max{0};
    bool valid{false};
};

// Render-thread side of the shared state. Keeps a rolling display buffer
// of at most kCapacity candles and consumes the one-shot flags.
class PriceHistoryView {
public:
    static constexpr std::size_t kCapacity = 100;

    // One render tick. Returns the metric values to draw; the returned
    // snapshot's history is left empty, use buffer() instead.
    MetricSnapshot tick(SharedState& state);

    const domain::History& buffer() const { return buffer_; }
    const TimeBounds& bounds() const { return bounds_; }

    // Whether the last tick consumed a timeframe change.
    bool viewWasReset() const { return viewWasReset_; }

private:
    void append(double price, domain::EpochSeconds now);
    void recomputeBounds();
    void extendBounds();

    domain::History buffer_;
    std::uint64_t seenVersion_{0};
    TimeBounds bounds_;
    bool viewWasReset_{false};
};

}  // namespace app
