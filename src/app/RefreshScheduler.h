#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace app {

class RefreshCoordinator;

struct SchedulerConfig {
    std::chrono::seconds priceInterval{60};
    std::chrono::seconds networkInterval{120};
    bool bootstrap{true};
};

// Two independent periodic triggers, each on its own thread. The price
// timer runs the history bootstrap before its first tick; both fire once
// immediately and then on their interval until stop().
class RefreshScheduler {
public:
    explicit RefreshScheduler(RefreshCoordinator& coordinator, SchedulerConfig cfg = {});
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    void start();
    // Wakes both timers without joining; a timer inside a gateway call exits
    // once that call returns.
    void requestStop();
    // requestStop() plus joining both timer threads.
    void stop();

private:
    void runTimer(const char* name, std::chrono::seconds interval, const std::function<void()>& tick);
    bool waitFor(std::chrono::seconds interval);

    RefreshCoordinator& coordinator_;
    SchedulerConfig cfg_;

    std::thread priceTimer_;
    std::thread networkTimer_;
    std::atomic<bool> running_{false};
    std::mutex waitMutex_;
    std::condition_variable wake_;
};

}  // namespace app
