#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace config {
class SettingsStore;
}

namespace app {

class RefreshCoordinator;
class SharedState;

struct Command {
    enum class Kind {
        RefreshPrice,
        RefreshNetwork,
        SelectTimeframe,
        SetCustomEndpoint,
        ApplyEndpointUrl,
        ResetEndpoint,
    };

    Kind kind{Kind::RefreshPrice};
    domain::Timeframe timeframe{domain::Timeframe::Hours24};
    bool enabled{false};
    std::string url;

    static Command refreshPrice() { return Command{Kind::RefreshPrice}; }
    static Command refreshNetwork() { return Command{Kind::RefreshNetwork}; }
    static Command selectTimeframe(domain::Timeframe tf) {
        Command c{Kind::SelectTimeframe};
        c.timeframe = tf;
        return c;
    }
    static Command setCustomEndpoint(bool on) {
        Command c{Kind::SetCustomEndpoint};
        c.enabled = on;
        return c;
    }
    static Command applyEndpointUrl(std::string value) {
        Command c{Kind::ApplyEndpointUrl};
        c.url = std::move(value);
        return c;
    }
    static Command resetEndpoint() { return Command{Kind::ResetEndpoint}; }
};

const char* command_kind_to_string(Command::Kind kind);

// Executes menu commands off the render thread. Commands run in posting
// order on one command thread; manual and settings-triggered refreshes are
// handed to their own worker threads so they never queue behind each other.
class CommandDispatcher {
public:
    CommandDispatcher(RefreshCoordinator& coordinator, SharedState& state, config::SettingsStore* settings);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void start();
    // Drops queued commands and refuses new ones without joining anything.
    void requestStop();
    // requestStop(), then joins the command thread and every worker.
    void stop();

    // Returns false once stopped.
    bool post(Command command);

    // Blocks until the queue is empty, no command is executing and every
    // worker has finished.
    void waitIdle();

    std::size_t activeWorkers() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run();
    void execute(const Command& command);
    void selectTimeframe(domain::Timeframe timeframe);
    void spawnWorker(const char* name, std::function<void()> job);
    void reapWorkers(bool all);

    RefreshCoordinator& coordinator_;
    SharedState& state_;
    config::SettingsStore* settings_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<Command> queue_;
    bool executing_{false};
    std::size_t pendingWorkers_{0};

    std::mutex workersMutex_;
    std::vector<Worker> workers_;
};

}  // namespace app
