#include "app/CommandDispatcher.h"

#include "app/RefreshCoordinator.h"
#include "app/SharedState.h"
#include "config/SettingsStore.h"
#include "logging/Log.h"

#include <exception>
#include <utility>

namespace app {

const char* command_kind_to_string(Command::Kind kind) {
    switch (kind) {
    case Command::Kind::RefreshPrice:
        return "refresh-price";
    case Command::Kind::RefreshNetwork:
        return "refresh-network";
    case Command::Kind::SelectTimeframe:
        return "select-timeframe";
    case Command::Kind::SetCustomEndpoint:
        return "set-custom-endpoint";
    case Command::Kind::ApplyEndpointUrl:
        return "apply-endpoint-url";
    case Command::Kind::ResetEndpoint:
        return "reset-endpoint";
    }
    return "unknown";
}

CommandDispatcher::CommandDispatcher(RefreshCoordinator& coordinator,
                                     SharedState& state,
                                     config::SettingsStore* settings)
    : coordinator_(coordinator),
      state_(state),
      settings_(settings) {}

CommandDispatcher::~CommandDispatcher() {
    stop();
}

void CommandDispatcher::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void CommandDispatcher::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false, std::memory_order_release);
        if (!queue_.empty()) {
            LOG_DEBUG(logging::LogCategory::UI, "Dropping %zu queued commands", queue_.size());
            queue_.clear();
        }
    }
    queueCv_.notify_all();
    idleCv_.notify_all();
}

void CommandDispatcher::stop() {
    requestStop();
    if (thread_.joinable()) {
        thread_.join();
    }
    reapWorkers(true);
    idleCv_.notify_all();
}

bool CommandDispatcher::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return false;
        }
        LOG_DEBUG(logging::LogCategory::UI, "Command queued: %s", command_kind_to_string(command.kind));
        queue_.push_back(std::move(command));
    }
    queueCv_.notify_one();
    return true;
}

void CommandDispatcher::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this]() {
        return (queue_.empty() && !executing_ && pendingWorkers_ == 0) || !running_.load(std::memory_order_acquire);
    });
}

std::size_t CommandDispatcher::activeWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingWorkers_;
}

void CommandDispatcher::run() {
    for (;;) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(std::memory_order_acquire); });
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            command = std::move(queue_.front());
            queue_.pop_front();
            executing_ = true;
        }

        try {
            execute(command);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::UI,
                      "Command %s failed: %s",
                      command_kind_to_string(command.kind),
                      ex.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            executing_ = false;
        }
        idleCv_.notify_all();
        reapWorkers(false);
    }
}

void CommandDispatcher::execute(const Command& command) {
    switch (command.kind) {
    case Command::Kind::RefreshPrice:
        spawnWorker("manual price refresh", [this]() { coordinator_.refreshPriceAndHistory(); });
        break;
    case Command::Kind::RefreshNetwork:
        spawnWorker("manual network refresh", [this]() { coordinator_.refreshNetworkMetrics(); });
        break;
    case Command::Kind::SelectTimeframe:
        selectTimeframe(command.timeframe);
        break;
    case Command::Kind::SetCustomEndpoint:
        LOG_GUARD(settings_, logging::LogCategory::UI, "No settings store, ignoring endpoint toggle");
        settings_->setCustomEnabled(command.enabled);
        spawnWorker("settings network refresh", [this]() { coordinator_.refreshNetworkMetrics(); });
        break;
    case Command::Kind::ApplyEndpointUrl:
        LOG_GUARD(settings_, logging::LogCategory::UI, "No settings store, ignoring endpoint URL");
        if (!settings_->setEndpointUrl(command.url)) {
            LOG_WARN(logging::LogCategory::UI, "Endpoint URL not applied: %s", command.url.c_str());
            return;
        }
        spawnWorker("settings network refresh", [this]() { coordinator_.refreshNetworkMetrics(); });
        break;
    case Command::Kind::ResetEndpoint:
        LOG_GUARD(settings_, logging::LogCategory::UI, "No settings store, ignoring reset");
        settings_->resetToDefault();
        spawnWorker("settings network refresh", [this]() { coordinator_.refreshNetworkMetrics(); });
        break;
    }
}

void CommandDispatcher::selectTimeframe(domain::Timeframe timeframe) {
    const bool changed = state_.update([timeframe](MetricSnapshot& s) {
        if (s.timeframe == timeframe) {
            return false;
        }
        s.timeframe = timeframe;
        s.timeframeChanged = true;
        return true;
    });

    if (!changed) {
        LOG_DEBUG(logging::LogCategory::UI, "Timeframe already %s", domain::timeframe_label(timeframe));
        return;
    }

    LOG_INFO(logging::LogCategory::UI, "Timeframe changed to %s", domain::timeframe_description(timeframe));
    coordinator_.refreshPriceAndHistory();
}

void CommandDispatcher::spawnWorker(const char* name, std::function<void()> job) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pendingWorkers_;
    }

    std::thread worker([this, name, job = std::move(job), done]() {
        try {
            job();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::UI, "%s failed: %s", name, ex.what());
        }
        done->store(true, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --pendingWorkers_;
        }
        idleCv_.notify_all();
    });

    std::lock_guard<std::mutex> lock(workersMutex_);
    workers_.push_back(Worker{std::move(worker), std::move(done)});
}

void CommandDispatcher::reapWorkers(bool all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        auto it = workers_.begin();
        while (it != workers_.end()) {
            if (all || it->done->load(std::memory_order_acquire)) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            }
            else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace app
