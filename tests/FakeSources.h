#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/TimeFormat.h"
#include "domain/MarketSource.h"

namespace testing_support {

inline domain::History makeHistory(std::initializer_list<double> closes, domain::EpochSeconds start = 1'700'000'000) {
    domain::History history;
    domain::EpochSeconds t = start;
    for (double close : closes) {
        domain::HistoryPoint point;
        point.time = core::makeTimeInfo(t);
        point.candle = domain::Candle{close, close + 1.0, close - 1.0, close};
        history.push_back(point);
        t += 3'600;
    }
    return history;
}

inline bool sameHistory(const domain::History& a, const domain::History& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].time.raw != b[i].time.raw || a[i].candle.open != b[i].candle.open ||
            a[i].candle.high != b[i].candle.high || a[i].candle.low != b[i].candle.low ||
            a[i].candle.close != b[i].candle.close) {
            return false;
        }
    }
    return true;
}

// Returns queued results in order; repeats the last one when the queue runs dry.
class FakePriceSource : public domain::PriceSource {
public:
    void queuePrice(domain::Result<double> result) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_.push_back(std::move(result));
    }

    void queueOhlc(domain::Result<domain::History> result) {
        std::lock_guard<std::mutex> lock(mutex_);
        ohlc_.push_back(std::move(result));
    }

    void setPriceDelay(std::chrono::milliseconds delay) { priceDelay_ = delay; }

    domain::Result<double> fetchCurrentPrice() override {
        priceCalls.fetch_add(1);
        if (priceDelay_.count() > 0) {
            std::this_thread::sleep_for(priceDelay_);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return next(prices_, domain::Result<double>::failure(domain::ErrorKind::Transport, "no scripted price"));
    }

    domain::Result<domain::History> fetchOhlc(domain::Timeframe timeframe) override {
        ohlcCalls.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        requestedTimeframes.push_back(timeframe);
        return next(ohlc_, domain::Result<domain::History>::failure(domain::ErrorKind::Transport, "no scripted ohlc"));
    }

    std::vector<domain::Timeframe> timeframes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requestedTimeframes;
    }

    std::atomic<int> priceCalls{0};
    std::atomic<int> ohlcCalls{0};

private:
    template <typename T>
    static T next(std::deque<T>& queue, T fallback) {
        if (queue.empty()) {
            return fallback;
        }
        T value = queue.front();
        if (queue.size() > 1) {
            queue.pop_front();
        }
        return value;
    }

    std::mutex mutex_;
    std::deque<domain::Result<double>> prices_;
    std::deque<domain::Result<domain::History>> ohlc_;
    std::vector<domain::Timeframe> requestedTimeframes;
    std::chrono::milliseconds priceDelay_{0};
};

class FakeNetworkSource : public domain::NetworkSource {
public:
    // Applied to every block and fee call, like a stalled connection.
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    domain::Result<domain::BlockInfo> fetchLatestBlock(const std::string& baseUrl) override {
        blockCalls.fetch_add(1);
        stall();
        std::lock_guard<std::mutex> lock(mutex_);
        baseUrls.push_back(baseUrl);
        return block;
    }

    domain::Result<domain::FeeEstimate> fetchFeeEstimate(const std::string& baseUrl) override {
        feeCalls.fetch_add(1);
        stall();
        std::lock_guard<std::mutex> lock(mutex_);
        baseUrls.push_back(baseUrl);
        return fees;
    }

    std::vector<std::string> urls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return baseUrls;
    }

    domain::Result<domain::BlockInfo> block =
        domain::Result<domain::BlockInfo>::failure(domain::ErrorKind::Transport, "unset");
    domain::Result<domain::FeeEstimate> fees =
        domain::Result<domain::FeeEstimate>::failure(domain::ErrorKind::Transport, "unset");
    std::atomic<int> blockCalls{0};
    std::atomic<int> feeCalls{0};

private:
    void stall() const {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
    }

    std::mutex mutex_;
    std::vector<std::string> baseUrls;
    std::chrono::milliseconds delay_{0};
};

}  // namespace testing_support
