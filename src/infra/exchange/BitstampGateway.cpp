#include "infra/exchange/BitstampGateway.h"

#include "core/TimeFormat.h"
#include "infra/exchange/JsonFields.h"
#include "logging/Log.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/json.hpp>

namespace infra::exchange {

namespace {

namespace json = boost::json;

constexpr double kPriceEpsilon = 1e-9;

std::string trimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool validateCandle(const domain::Candle& candle) {
    if (candle.open <= 0.0 || candle.close <= 0.0 || candle.low <= 0.0 || candle.high <= 0.0) {
        return false;
    }
    const auto minPrice = std::min(candle.open, candle.close);
    const auto maxPrice = std::max(candle.open, candle.close);
    if (candle.low - minPrice > kPriceEpsilon) {
        return false;
    }
    if (maxPrice - candle.high > kPriceEpsilon) {
        return false;
    }
    return true;
}

template <typename T>
domain::Result<T> fetchAndParse(const http::HttpClient& client,
                                const std::string& url,
                                domain::Result<T> (*parser)(const std::string&)) {
    http::HttpResponse response;
    try {
        response = client.get(url);
    }
    catch (const std::exception& ex) {
        return domain::Result<T>::failure(domain::ErrorKind::Transport, ex.what());
    }

    if (!response.success()) {
        return domain::Result<T>::failure(domain::ErrorKind::Status,
                                          "HTTP status " + std::to_string(response.status) + " from " + url);
    }
    return parser(response.body);
}

}  // namespace

BitstampGateway::BitstampGateway(BitstampGatewayConfig cfg)
    : cfg_(std::move(cfg)),
      client_(cfg_.timeoutSec) {
    cfg_.baseUrl = trimTrailingSlash(cfg_.baseUrl);
    if (cfg_.pair.empty()) {
        cfg_.pair = "btcusd";
    }
}

BitstampGateway::~BitstampGateway() = default;

std::string BitstampGateway::tickerUrl() const {
    return cfg_.baseUrl + "/ticker/" + cfg_.pair + "/";
}

std::string BitstampGateway::ohlcUrl(domain::Timeframe timeframe) const {
    const auto params = domain::timeframe_params(timeframe);
    return cfg_.baseUrl + "/ohlc/" + cfg_.pair + "/?step=" + std::to_string(params.stepSeconds) +
           "&limit=" + std::to_string(params.limit);
}

domain::Result<double> BitstampGateway::fetchCurrentPrice() {
    const std::string url = tickerUrl();
    LOG_DEBUG(logging::LogCategory::NET, "Fetching current price from %s", url.c_str());
    auto result = fetchAndParse<double>(client_, url, &bitstamp::parseTicker);
    if (result.failed()) {
        LOG_DEBUG(logging::LogCategory::NET,
                  "Price fetch failed kind=%s: %s",
                  domain::error_kind_to_string(result.kind),
                  result.error.c_str());
    }
    return result;
}

domain::Result<domain::History> BitstampGateway::fetchOhlc(domain::Timeframe timeframe) {
    const std::string url = ohlcUrl(timeframe);
    LOG_DEBUG(logging::LogCategory::NET,
              "Fetching historical data from %s (%s)",
              url.c_str(),
              domain::timeframe_description(timeframe));
    auto result = fetchAndParse<domain::History>(client_, url, &bitstamp::parseOhlc);
    if (result.failed()) {
        LOG_DEBUG(logging::LogCategory::NET,
                  "OHLC fetch failed kind=%s: %s",
                  domain::error_kind_to_string(result.kind),
                  result.error.c_str());
    }
    else {
        LOG_INFO(logging::LogCategory::NET,
                 "Parsed historical data for %s (%zu candles)",
                 domain::timeframe_description(timeframe),
                 result.value.size());
    }
    return result;
}

namespace bitstamp {

domain::Result<double> parseTicker(const std::string& body) {
    json::error_code ec;
    const json::value root = json::parse(body, ec);
    if (ec) {
        return domain::Result<double>::failure(domain::ErrorKind::Parse, "ticker: " + ec.message());
    }
    const auto* object = root.if_object();
    if (!object) {
        return domain::Result<double>::failure(domain::ErrorKind::Parse, "ticker: payload is not an object");
    }
    const auto* last = field(*object, "last");
    double price = 0.0;
    if (!last || !readDecimal(*last, price) || price <= 0.0) {
        return domain::Result<double>::failure(domain::ErrorKind::Parse, "ticker: missing or invalid 'last'");
    }
    return domain::Result<double>::success(price);
}

domain::Result<domain::History> parseOhlc(const std::string& body) {
    using HistoryResult = domain::Result<domain::History>;

    json::error_code ec;
    const json::value root = json::parse(body, ec);
    if (ec) {
        return HistoryResult::failure(domain::ErrorKind::Parse, "ohlc: " + ec.message());
    }

    const json::array* records = nullptr;
    if (const auto* object = root.if_object()) {
        if (const auto* data = field(*object, "data"); data && data->is_object()) {
            if (const auto* ohlc = field(data->get_object(), "ohlc"); ohlc && ohlc->is_array()) {
                records = &ohlc->get_array();
            }
        }
    }
    if (!records) {
        return HistoryResult::failure(domain::ErrorKind::Parse, "ohlc: missing data.ohlc array");
    }

    domain::History history;
    history.reserve(records->size());
    std::size_t dropped = 0;

    for (const auto& entry : *records) {
        const auto* record = entry.if_object();
        if (!record) {
            ++dropped;
            continue;
        }

        std::int64_t timestamp = 0;
        domain::Candle candle{};
        const auto* ts = field(*record, "timestamp");
        const auto* open = field(*record, "open");
        const auto* high = field(*record, "high");
        const auto* low = field(*record, "low");
        const auto* close = field(*record, "close");
        const bool parsed = ts && open && high && low && close &&
                            readInt64(*ts, timestamp) && timestamp > 0 &&
                            readDecimal(*open, candle.open) &&
                            readDecimal(*high, candle.high) &&
                            readDecimal(*low, candle.low) &&
                            readDecimal(*close, candle.close);
        if (!parsed || !validateCandle(candle)) {
            ++dropped;
            LOG_DEBUG(logging::LogCategory::DATA, "Dropping unusable OHLC record #%zu", history.size() + dropped);
            continue;
        }

        domain::HistoryPoint point;
        point.time = core::makeTimeInfo(timestamp);
        point.candle = candle;
        history.push_back(std::move(point));
    }

    if (dropped > 0) {
        LOG_WARN(logging::LogCategory::DATA, "OHLC payload: dropped %zu of %zu records", dropped, records->size());
    }

    const auto byTime = [](const domain::HistoryPoint& a, const domain::HistoryPoint& b) {
        return a.time.raw < b.time.raw;
    };
    if (!std::is_sorted(history.begin(), history.end(), byTime)) {
        LOG_DEBUG(logging::LogCategory::DATA, "OHLC payload out of time order, sorting");
        std::stable_sort(history.begin(), history.end(), byTime);
    }

    if (history.empty()) {
        return HistoryResult::failure(domain::ErrorKind::Parse, "ohlc: no usable records");
    }
    return HistoryResult::success(std::move(history));
}

}  // namespace bitstamp

}  // namespace infra::exchange
