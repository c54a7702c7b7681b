#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace domain {

using EpochSeconds = std::int64_t;

enum class Timeframe { Hours24, Week, Month, Year };

// Candle interval and candle count requested upstream for one timeframe.
struct TimeframeParams {
    std::int64_t stepSeconds{0};
    std::size_t limit{0};
};

inline TimeframeParams timeframe_params(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::Hours24:
        return {3'600, 24};
    case Timeframe::Week:
        return {14'400, 42};
    case Timeframe::Month:
        return {86'400, 30};
    case Timeframe::Year:
        return {86'400, 365};
    }
    return {3'600, 24};
}

inline const char* timeframe_description(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::Hours24:
        return "24 Hours (hourly)";
    case Timeframe::Week:
        return "1 Week (4-hour)";
    case Timeframe::Month:
        return "1 Month (daily)";
    case Timeframe::Year:
        return "1 Year (daily)";
    }
    return "";
}

inline const char* timeframe_chart_title(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::Hours24:
        return "BTC Price (24 hours - hourly)";
    case Timeframe::Week:
        return "BTC Price (1 week - 4-hour)";
    case Timeframe::Month:
        return "BTC Price (1 month - daily)";
    case Timeframe::Year:
        return "BTC Price (1 year - daily)";
    }
    return "BTC Price";
}

inline const char* timeframe_label(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::Hours24:
        return "24h";
    case Timeframe::Week:
        return "week";
    case Timeframe::Month:
        return "month";
    case Timeframe::Year:
        return "year";
    }
    return "24h";
}

inline std::optional<Timeframe> timeframe_from_label(std::string_view label) {
    if (label == "24h") {
        return Timeframe::Hours24;
    }
    if (label == "week") {
        return Timeframe::Week;
    }
    if (label == "month") {
        return Timeframe::Month;
    }
    if (label == "year") {
        return Timeframe::Year;
    }
    return std::nullopt;
}

struct Candle {
    double open{0};
    double high{0};
    double low{0};
    double close{0};
};

// Derived once at ingestion; never recomputed.
struct TimeInfo {
    EpochSeconds raw{0};
    std::string display;
    std::string iso8601;
};

struct HistoryPoint {
    TimeInfo time;
    Candle candle;
};

using History = std::vector<HistoryPoint>;

struct BlockInfo {
    std::string id;
    std::uint32_t height{0};
    EpochSeconds timestamp{0};
    double difficulty{0};
    std::uint32_t txCount{0};
    std::uint32_t size{0};
    std::uint32_t weight{0};
    std::optional<std::string> previousBlockHash;
};

// Fee tiers in sat/vB.
struct FeeEstimate {
    std::uint32_t fastest{0};
    std::uint32_t halfHour{0};
    std::uint32_t hour{0};
    std::uint32_t economy{0};
    std::uint32_t minimum{0};
};

enum class ErrorKind { None, Transport, Status, Parse };

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Status:
        return "status";
    case ErrorKind::Parse:
        return "parse";
    }
    return "unknown";
}

template <typename T>
struct Result {
    T value{};
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string error{};

    bool failed() const { return !ok; }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorKind k, std::string message) {
        Result r;
        r.ok = false;
        r.kind = k;
        r.error = std::move(message);
        return r;
    }
};

}  // namespace domain
