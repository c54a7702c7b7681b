#include "infra/exchange/MempoolGateway.h"

#include "infra/exchange/JsonFields.h"
#include "logging/Log.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <utility>

#include <boost/json.hpp>

namespace infra::exchange {

namespace {

namespace json = boost::json;

std::string joinPath(std::string base, const std::string& path) {
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

std::string trimmedText(const std::string& body) {
    auto begin = std::find_if_not(body.begin(), body.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(body.rbegin(), body.rend(), [](unsigned char c) {
                   return std::isspace(c) != 0;
               }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

template <typename T, typename U>
domain::Result<T> forwardFailure(const domain::Result<U>& source) {
    return domain::Result<T>::failure(source.kind, source.error);
}

}  // namespace

MempoolGateway::MempoolGateway(MempoolGatewayConfig cfg)
    : cfg_(cfg),
      client_(cfg_.timeoutSec) {}

MempoolGateway::~MempoolGateway() = default;

domain::Result<std::string> MempoolGateway::getText(const std::string& url) const {
    http::HttpResponse response;
    try {
        response = client_.get(url);
    }
    catch (const std::exception& ex) {
        return domain::Result<std::string>::failure(domain::ErrorKind::Transport, ex.what());
    }
    if (!response.success()) {
        return domain::Result<std::string>::failure(
            domain::ErrorKind::Status, "HTTP status " + std::to_string(response.status) + " from " + url);
    }
    return domain::Result<std::string>::success(std::move(response.body));
}

domain::Result<domain::BlockInfo> MempoolGateway::fetchLatestBlock(const std::string& baseUrl) {
    using BlockResult = domain::Result<domain::BlockInfo>;

    auto heightBody = getText(joinPath(baseUrl, "/blocks/tip/height"));
    if (heightBody.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "Tip height request failed: %s", heightBody.error.c_str());
        return forwardFailure<domain::BlockInfo>(heightBody);
    }
    const auto height = mempool::parseTipHeight(heightBody.value);
    if (height.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "%s", height.error.c_str());
        return forwardFailure<domain::BlockInfo>(height);
    }

    auto hashBody = getText(joinPath(baseUrl, "/block-height/" + std::to_string(height.value)));
    if (hashBody.failed()) {
        LOG_DEBUG(logging::LogCategory::NET,
                  "Block id request for height %u failed: %s",
                  height.value,
                  hashBody.error.c_str());
        return forwardFailure<domain::BlockInfo>(hashBody);
    }
    const auto blockId = mempool::parseBlockId(hashBody.value);
    if (blockId.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "%s", blockId.error.c_str());
        return forwardFailure<domain::BlockInfo>(blockId);
    }

    auto blockBody = getText(joinPath(baseUrl, "/block/" + blockId.value));
    if (blockBody.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "Block details request failed: %s", blockBody.error.c_str());
        return forwardFailure<domain::BlockInfo>(blockBody);
    }
    BlockResult block = mempool::parseBlock(blockBody.value);
    if (block.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "%s", block.error.c_str());
        return block;
    }

    LOG_DEBUG(logging::LogCategory::NET,
              "Latest block %u id=%s tx=%u",
              block.value.height,
              block.value.id.c_str(),
              block.value.txCount);
    return block;
}

domain::Result<domain::FeeEstimate> MempoolGateway::fetchFeeEstimate(const std::string& baseUrl) {
    auto body = getText(joinPath(baseUrl, "/v1/fees/recommended"));
    if (body.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "Fee estimate request failed: %s", body.error.c_str());
        return forwardFailure<domain::FeeEstimate>(body);
    }
    auto fees = mempool::parseFees(body.value);
    if (fees.failed()) {
        LOG_DEBUG(logging::LogCategory::NET, "%s", fees.error.c_str());
    }
    return fees;
}

namespace mempool {

domain::Result<std::uint32_t> parseTipHeight(const std::string& body) {
    std::int64_t height = 0;
    if (!parseIntegerText(body, height) || height < 0 || height > std::numeric_limits<std::uint32_t>::max()) {
        return domain::Result<std::uint32_t>::failure(domain::ErrorKind::Parse,
                                                      "tip height: not an integer: '" + trimmedText(body) + "'");
    }
    return domain::Result<std::uint32_t>::success(static_cast<std::uint32_t>(height));
}

domain::Result<std::string> parseBlockId(const std::string& body) {
    std::string id = trimmedText(body);
    const bool hex = !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
    if (!hex) {
        return domain::Result<std::string>::failure(domain::ErrorKind::Parse, "block id: not a hex hash");
    }
    return domain::Result<std::string>::success(std::move(id));
}

domain::Result<domain::BlockInfo> parseBlock(const std::string& body) {
    using BlockResult = domain::Result<domain::BlockInfo>;

    json::error_code ec;
    const json::value root = json::parse(body, ec);
    if (ec) {
        return BlockResult::failure(domain::ErrorKind::Parse, "block: " + ec.message());
    }
    const auto* object = root.if_object();
    if (!object) {
        return BlockResult::failure(domain::ErrorKind::Parse, "block: payload is not an object");
    }

    domain::BlockInfo info;
    const auto* id = field(*object, "id");
    const auto* height = field(*object, "height");
    const auto* timestamp = field(*object, "timestamp");
    const auto* difficulty = field(*object, "difficulty");
    const auto* txCount = field(*object, "tx_count");
    const auto* size = field(*object, "size");
    const auto* weight = field(*object, "weight");
    const bool parsed = id && height && timestamp && difficulty && txCount && size && weight &&
                        readString(*id, info.id) &&
                        readUint32(*height, info.height) &&
                        readInt64(*timestamp, info.timestamp) &&
                        readDecimal(*difficulty, info.difficulty) &&
                        readUint32(*txCount, info.txCount) &&
                        readUint32(*size, info.size) &&
                        readUint32(*weight, info.weight);
    if (!parsed) {
        return BlockResult::failure(domain::ErrorKind::Parse, "block: missing or invalid field");
    }

    // Absent for the genesis block.
    if (const auto* previous = field(*object, "previousblockhash")) {
        std::string hash;
        if (readString(*previous, hash)) {
            info.previousBlockHash = std::move(hash);
        }
    }
    return BlockResult::success(std::move(info));
}

domain::Result<domain::FeeEstimate> parseFees(const std::string& body) {
    using FeeResult = domain::Result<domain::FeeEstimate>;

    json::error_code ec;
    const json::value root = json::parse(body, ec);
    if (ec) {
        return FeeResult::failure(domain::ErrorKind::Parse, "fees: " + ec.message());
    }
    const auto* object = root.if_object();
    if (!object) {
        return FeeResult::failure(domain::ErrorKind::Parse, "fees: payload is not an object");
    }

    domain::FeeEstimate fees;
    struct Tier {
        const char* key;
        std::uint32_t* target;
    };
    const Tier tiers[] = {
        {"fastestFee", &fees.fastest},
        {"halfHourFee", &fees.halfHour},
        {"hourFee", &fees.hour},
        {"economyFee", &fees.economy},
        {"minimumFee", &fees.minimum},
    };
    for (const auto& tier : tiers) {
        const auto* value = field(*object, tier.key);
        if (!value || !readUint32(*value, *tier.target)) {
            return FeeResult::failure(domain::ErrorKind::Parse, std::string("fees: missing or invalid ") + tier.key);
        }
    }
    return FeeResult::success(fees);
}

}  // namespace mempool

}  // namespace infra::exchange
