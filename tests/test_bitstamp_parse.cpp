#include <iostream>
#include <string>

#include "config/Config.h"
#include "infra/exchange/BitstampGateway.h"
#include "logging/Log.h"

using infra::exchange::bitstamp::parseOhlc;
using infra::exchange::bitstamp::parseTicker;

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    {
        const auto price = parseTicker(R"({"timestamp":"1700000000","last":"67250.12","bid":"67250.00"})");
        if (price.failed() || price.value != 67250.12) {
            std::cerr << "Expected ticker 'last' to parse, error=" << price.error << "\n";
            return 1;
        }
    }

    {
        const auto missing = parseTicker(R"({"bid":"1"})");
        const auto garbage = parseTicker(R"({"last":"12abc"})");
        const auto malformed = parseTicker("<html>rate limited</html>");
        if (!missing.failed() || !garbage.failed() || !malformed.failed()) {
            std::cerr << "Expected invalid tickers to fail\n";
            return 1;
        }
        if (missing.kind != domain::ErrorKind::Parse || malformed.kind != domain::ErrorKind::Parse) {
            std::cerr << "Expected Parse error kind for invalid tickers\n";
            return 1;
        }
    }

    {
        const std::string body = R"({"data":{"pair":"BTC/USD","ohlc":[
            {"timestamp":"1700000000","open":"100.0","high":"110.0","low":"95.0","close":"105.0","volume":"1.0"},
            {"timestamp":"1700003600","open":"105.0","high":"108.0","low":"101.0","close":"102.5","volume":"2.0"},
            {"timestamp":"1700007200","open":"102.5","high":"104.0","low":"99.0","close":"103.0","volume":"0.5"}
        ]}})";
        const auto history = parseOhlc(body);
        if (history.failed() || history.value.size() != 3) {
            std::cerr << "Expected 3 candles, error=" << history.error << "\n";
            return 1;
        }
        const auto& second = history.value[1];
        if (second.time.raw != 1700003600 || second.candle.open != 105.0 || second.candle.high != 108.0 ||
            second.candle.low != 101.0 || second.candle.close != 102.5) {
            std::cerr << "Second candle fields mismatch\n";
            return 1;
        }
        if (second.time.display.empty() || second.time.iso8601 != "2023-11-14T23:13:20+00:00") {
            std::cerr << "Unexpected time info: '" << second.time.iso8601 << "'\n";
            return 1;
        }
    }

    {
        // One bad field drops only that record.
        const std::string body = R"({"data":{"ohlc":[
            {"timestamp":"1700000000","open":"100","high":"110","low":"95","close":"105"},
            {"timestamp":"1700003600","open":"n/a","high":"108","low":"101","close":"102"},
            {"timestamp":"1700007200","open":"102","high":"104","low":"99","close":"103"},
            {"timestamp":"later","open":"102","high":"104","low":"99","close":"103"},
            {"timestamp":"1700010800","open":"103","high":"104","low":"99"}
        ]}})";
        const auto history = parseOhlc(body);
        if (history.failed() || history.value.size() != 2) {
            std::cerr << "Expected 2 usable candles, got " << history.value.size() << "\n";
            return 1;
        }
        if (history.value[0].time.raw != 1700000000 || history.value[1].time.raw != 1700007200) {
            std::cerr << "Expected usable records in time order\n";
            return 1;
        }
    }

    {
        // Out-of-order records are sorted by time; equal timestamps keep their order.
        const std::string body = R"({"data":{"ohlc":[
            {"timestamp":"1700007200","open":"3","high":"4","low":"2","close":"3"},
            {"timestamp":"1700000000","open":"1","high":"2","low":"1","close":"1"},
            {"timestamp":"1700003600","open":"2","high":"3","low":"1","close":"2"},
            {"timestamp":"1700003600","open":"2","high":"3","low":"1","close":"2.5"}
        ]}})";
        const auto history = parseOhlc(body);
        if (history.failed() || history.value.size() != 4) {
            std::cerr << "Expected 4 candles from the unordered payload\n";
            return 1;
        }
        const auto& points = history.value;
        if (points[0].time.raw != 1700000000 || points[1].time.raw != 1700003600 ||
            points[2].time.raw != 1700003600 || points[3].time.raw != 1700007200) {
            std::cerr << "Out-of-order payload must be sorted ascending, front=" << points[0].time.raw << "\n";
            return 1;
        }
        if (points[0].candle.close != 1.0 || points[1].candle.close != 2.0 || points[2].candle.close != 2.5 ||
            points[3].candle.close != 3.0) {
            std::cerr << "Candles must move with their timestamps and ties must keep upstream order\n";
            return 1;
        }
    }

    {
        const auto empty = parseOhlc(R"({"data":{"ohlc":[]}})");
        const auto wrongShape = parseOhlc(R"({"data":[]})");
        const auto allBad = parseOhlc(R"({"data":{"ohlc":[{"timestamp":"x"}]}})");
        if (!empty.failed() || !wrongShape.failed() || !allBad.failed()) {
            std::cerr << "Expected payloads without usable candles to fail\n";
            return 1;
        }
    }

    {
        infra::exchange::BitstampGatewayConfig cfg;
        cfg.baseUrl = "https://www.bitstamp.net/api/v2/";
        infra::exchange::BitstampGateway gateway(cfg);
        if (gateway.tickerUrl() != "https://www.bitstamp.net/api/v2/ticker/btcusd/") {
            std::cerr << "Unexpected ticker URL " << gateway.tickerUrl() << "\n";
            return 1;
        }
        if (gateway.ohlcUrl(domain::Timeframe::Week) != "https://www.bitstamp.net/api/v2/ohlc/btcusd/?step=14400&limit=42") {
            std::cerr << "Unexpected week OHLC URL " << gateway.ohlcUrl(domain::Timeframe::Week) << "\n";
            return 1;
        }
        if (gateway.ohlcUrl(domain::Timeframe::Year) != "https://www.bitstamp.net/api/v2/ohlc/btcusd/?step=86400&limit=365") {
            std::cerr << "Unexpected year OHLC URL\n";
            return 1;
        }
    }

    return 0;
}
