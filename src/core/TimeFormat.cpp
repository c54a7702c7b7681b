#include "core/TimeFormat.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::tm toLocalTm(domain::EpochSeconds value) {
    const std::time_t seconds = static_cast<std::time_t>(value);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    return tm;
}

std::tm toUtcTm(domain::EpochSeconds value) {
    const std::time_t seconds = static_cast<std::time_t>(value);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    return tm;
}

}  // namespace

namespace core {

std::string formatLocal(domain::EpochSeconds seconds, const char* pattern) {
    if (seconds <= 0) {
        return "Invalid timestamp";
    }
    std::tm tm = toLocalTm(seconds);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string formatIso8601Utc(domain::EpochSeconds seconds) {
    std::tm tm = toUtcTm(seconds);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S+00:00");
    return oss.str();
}

domain::EpochSeconds nowEpochSeconds() {
    using namespace std::chrono;
    return static_cast<domain::EpochSeconds>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

std::string currentTimestamp() {
    return formatLocal(nowEpochSeconds(), TimeFormat::kSecondFormat);
}

domain::TimeInfo makeTimeInfo(domain::EpochSeconds seconds) {
    domain::TimeInfo info;
    info.raw = seconds;
    info.display = formatLocal(seconds, TimeFormat::kMinuteFormat);
    info.iso8601 = formatIso8601Utc(seconds);
    return info;
}

}  // namespace core
