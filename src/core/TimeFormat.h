#pragma once

#include <string>

#include "domain/Types.h"

namespace core {

namespace TimeFormat {
constexpr const char* kMinuteFormat = "%Y-%m-%d %H:%M";
constexpr const char* kSecondFormat = "%Y-%m-%d %H:%M:%S";
constexpr const char* kFallbackMarker = "* (fallback)";
}  // namespace TimeFormat

std::string formatLocal(domain::EpochSeconds seconds, const char* pattern);
std::string formatIso8601Utc(domain::EpochSeconds seconds);

// Local wall-clock "now" as shown in the "last updated" fields.
std::string currentTimestamp();
domain::EpochSeconds nowEpochSeconds();

domain::TimeInfo makeTimeInfo(domain::EpochSeconds seconds);

}  // namespace core
