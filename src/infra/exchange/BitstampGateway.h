#pragma once

#include <string>

#include "domain/MarketSource.h"
#include "infra/http/HttpClient.h"

namespace infra::exchange {

struct BitstampGatewayConfig {
    std::string baseUrl{"https://www.bitstamp.net/api/v2"};
    std::string pair{"btcusd"};
    int timeoutSec{10};
};

class BitstampGateway : public domain::PriceSource {
public:
    explicit BitstampGateway(BitstampGatewayConfig cfg = {});
    ~BitstampGateway() override;

    domain::Result<double> fetchCurrentPrice() override;
    domain::Result<domain::History> fetchOhlc(domain::Timeframe timeframe) override;

    std::string tickerUrl() const;
    std::string ohlcUrl(domain::Timeframe timeframe) const;

private:
    BitstampGatewayConfig cfg_;
    http::HttpClient client_;
};

namespace bitstamp {

// {"last": "67250.12", ...}
domain::Result<double> parseTicker(const std::string& body);

// {"data": {"ohlc": [{"timestamp": "...", "open": "...", ...}, ...]}}
// Records with any unusable field are dropped; the rest keep upstream order.
domain::Result<domain::History> parseOhlc(const std::string& body);

}  // namespace bitstamp

}  // namespace infra::exchange
