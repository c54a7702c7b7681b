#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>

#include "domain/Types.h"

namespace app {

inline constexpr const char* kNeverUpdated = "Never";
inline constexpr const char* kUnknownBlockTime = "Unknown";

// Latest known value of every displayed metric plus the flags the render
// loop consumes. Copied out whole; never handed out by reference.
struct MetricSnapshot {
    double price{0.0};
    std::string lastUpdated{kNeverUpdated};
    bool priceIsFallback{false};

    domain::History history;
    // Bumped on every full replacement of `history`.
    std::uint64_t historyVersion{0};
    domain::Timeframe timeframe{domain::Timeframe::Hours24};

    std::uint32_t blockHeight{0};
    std::string blockTime{kUnknownBlockTime};
    domain::FeeEstimate fees;
    std::string mempoolLastUpdated{kNeverUpdated};

    bool updating{false};
    bool mempoolUpdating{false};
    bool newPriceFetched{false};
    bool timeframeChanged{false};
};

// One coarse lock over the whole record. Callers keep critical sections
// short and never perform I/O inside update()/read().
class SharedState {
public:
    explicit SharedState(domain::Timeframe initial = domain::Timeframe::Hours24) {
        snapshot_.timeframe = initial;
    }

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    MetricSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    template <typename Fn>
    decltype(auto) update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(snapshot_);
    }

    template <typename Fn>
    decltype(auto) read(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const MetricSnapshot&>(snapshot_));
    }

    domain::Timeframe timeframe() const {
        return read([](const MetricSnapshot& s) { return s.timeframe; });
    }

private:
    mutable std::mutex mutex_;
    MetricSnapshot snapshot_;
};

}  // namespace app
