#include "app/RefreshScheduler.h"

#include "app/RefreshCoordinator.h"
#include "logging/Log.h"

#include <exception>

namespace app {

RefreshScheduler::RefreshScheduler(RefreshCoordinator& coordinator, SchedulerConfig cfg)
    : coordinator_(coordinator),
      cfg_(cfg) {}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    LOG_INFO(logging::LogCategory::STATE,
             "Starting timers: price every %llds, network every %llds",
             static_cast<long long>(cfg_.priceInterval.count()),
             static_cast<long long>(cfg_.networkInterval.count()));

    priceTimer_ = std::thread([this]() {
        if (cfg_.bootstrap) {
            coordinator_.bootstrapHistory();
        }
        runTimer("price", cfg_.priceInterval, [this]() { coordinator_.refreshPriceAndHistory(); });
    });

    networkTimer_ = std::thread([this]() {
        runTimer("network", cfg_.networkInterval, [this]() { coordinator_.refreshNetworkMetrics(); });
    });
}

void RefreshScheduler::requestStop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        running_.store(false, std::memory_order_release);
    }
    wake_.notify_all();
}

void RefreshScheduler::stop() {
    requestStop();
    if (priceTimer_.joinable()) {
        priceTimer_.join();
    }
    if (networkTimer_.joinable()) {
        networkTimer_.join();
    }
}

void RefreshScheduler::runTimer(const char* name,
                                std::chrono::seconds interval,
                                const std::function<void()>& tick) {
    while (running_.load(std::memory_order_acquire)) {
        try {
            tick();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::STATE, "%s timer tick failed: %s", name, ex.what());
        }
        if (!waitFor(interval)) {
            break;
        }
    }
    LOG_DEBUG(logging::LogCategory::STATE, "%s timer stopped", name);
}

bool RefreshScheduler::waitFor(std::chrono::seconds interval) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    wake_.wait_for(lock, interval, [this]() { return !running_.load(std::memory_order_acquire); });
    return running_.load(std::memory_order_acquire);
}

}  // namespace app
