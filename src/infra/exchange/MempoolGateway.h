#pragma once

#include <cstdint>
#include <string>

#include "domain/MarketSource.h"
#include "infra/http/HttpClient.h"

namespace infra::exchange {

struct MempoolGatewayConfig {
    int timeoutSec{10};
};

class MempoolGateway : public domain::NetworkSource {
public:
    explicit MempoolGateway(MempoolGatewayConfig cfg = {});
    ~MempoolGateway() override;

    // tip height -> block id -> block details, three sequential requests.
    domain::Result<domain::BlockInfo> fetchLatestBlock(const std::string& baseUrl) override;
    domain::Result<domain::FeeEstimate> fetchFeeEstimate(const std::string& baseUrl) override;

private:
    domain::Result<std::string> getText(const std::string& url) const;

    MempoolGatewayConfig cfg_;
    http::HttpClient client_;
};

namespace mempool {

domain::Result<std::uint32_t> parseTipHeight(const std::string& body);
domain::Result<std::string> parseBlockId(const std::string& body);
domain::Result<domain::BlockInfo> parseBlock(const std::string& body);
domain::Result<domain::FeeEstimate> parseFees(const std::string& body);

}  // namespace mempool

}  // namespace infra::exchange
