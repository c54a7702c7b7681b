#include "logging/Log.h"

#include <array>
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>

namespace logging {

namespace {

constexpr std::size_t kMessageBufferSize = 1024;

// Formats into `buffer`, marking truncated messages with a trailing "...".
void formatMessage(std::array<char, kMessageBufferSize>& buffer, const char* fmt, std::va_list args) {
    std::va_list argsCopy;
    va_copy(argsCopy, args);
    const int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, argsCopy);
    va_end(argsCopy);

    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
        return;
    }
    if (static_cast<std::size_t>(written) >= buffer.size()) {
        const std::size_t end = buffer.size() - 1;
        buffer[end - 3] = '.';
        buffer[end - 2] = '.';
        buffer[end - 1] = '.';
        buffer[end] = '\0';
    }
}

// Local wall clock, "YYYY-MM-DD HH:MM:SS.mmm".
void formatTimestamp(char* out, std::size_t size) {
    using namespace std::chrono;
    const auto sinceEpoch = duration_cast<milliseconds>(system_clock::now().time_since_epoch());
    const std::time_t seconds = static_cast<std::time_t>(sinceEpoch.count() / 1000);
    const int millis = static_cast<int>(sinceEpoch.count() % 1000);

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    const std::size_t len = std::strftime(out, size, "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(out + len, size - len, ".%03d", millis);
}

unsigned threadTag() {
    return static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000U);
}

}  // namespace

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};
std::mutex Log::outputMutex;
std::unique_ptr<std::FILE, Log::FileCloser> Log::file;

void Log::FileCloser::operator()(std::FILE* stream) const {
    if (stream) {
        std::fclose(stream);
    }
}

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

void Log::SetGlobalLogLevel(config::LogLevel level) {
    set_log_level(level);
    LOG_DEBUG(LogCategory::CONFIG, "Log level set to %s", level_to_string(level));
}

bool Log::open_file(const std::string& path) {
    std::FILE* stream = std::fopen(path.c_str(), "a");
    if (!stream) {
        LOG_WARN(LogCategory::CONFIG, "Cannot open log file %s, logging to stderr", path.c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        file.reset(stream);
    }
    LOG_INFO(LogCategory::CONFIG, "Logging to %s", path.c_str());
    return true;
}

void Log::close_file() {
    std::lock_guard<std::mutex> lock(outputMutex);
    file.reset();
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::STATE:
        return "STATE";
    case LogCategory::RENDER:
        return "RENDER";
    case LogCategory::UI:
        return "UI";
    case LogCategory::CONFIG:
        return "CONFIG";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (!config::logLevelAtLeast(currentLevel.load(std::memory_order_relaxed), level)) {
        return;
    }

    std::array<char, kMessageBufferSize> message{};
    formatMessage(message, fmt, args);

    char timestamp[32];
    formatTimestamp(timestamp, sizeof(timestamp));

    std::lock_guard<std::mutex> lock(outputMutex);
    std::FILE* out = file ? file.get() : stderr;
    std::fprintf(out,
                 "%s %-5s %-6s [t%04u] %s\n",
                 timestamp,
                 level_to_string(level),
                 category_to_string(category),
                 threadTag(),
                 message.data());
    std::fflush(out);
}

}  // namespace logging
