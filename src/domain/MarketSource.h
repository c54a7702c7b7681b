#pragma once

#include <string>

#include "domain/Types.h"

namespace domain {

// Read-only exchange data. Calls block until the response arrives or the
// transport timeout expires.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual Result<double> fetchCurrentPrice() = 0;
    virtual Result<History> fetchOhlc(Timeframe timeframe) = 0;
};

// Read-only block explorer data. The base URL is passed per call because the
// user can switch endpoints while the application runs.
class NetworkSource {
public:
    virtual ~NetworkSource() = default;

    virtual Result<BlockInfo> fetchLatestBlock(const std::string& baseUrl) = 0;
    virtual Result<FeeEstimate> fetchFeeEstimate(const std::string& baseUrl) = 0;
};

}  // namespace domain
