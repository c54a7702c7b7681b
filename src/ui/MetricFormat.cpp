#include "ui/MetricFormat.h"

#include <cstdio>

namespace ui {

std::string formatPriceHeadline(double price) {
    if (price <= 0.0) {
        return kLoadingText;
    }
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "$%.2f | %.0f sats/$", price, kSatsPerBitcoin / price);
    return buffer;
}

std::string formatLastUpdated(const app::MetricSnapshot& snapshot) {
    std::string text = "Last updated: " + snapshot.lastUpdated;
    if (snapshot.updating) {
        text += "  (updating...)";
    }
    return text;
}

std::string formatBlockLine(const app::MetricSnapshot& snapshot) {
    std::string text = "Block Height: " + std::to_string(snapshot.blockHeight) +
                       "  |  Block Time: " + snapshot.blockTime +
                       "  |  Last Updated: " + snapshot.mempoolLastUpdated;
    if (snapshot.mempoolUpdating) {
        text += "  (updating...)";
    }
    return text;
}

std::string formatFeeLine(const app::MetricSnapshot& snapshot) {
    const auto& fees = snapshot.fees;
    return "Fees (sat/vB):  Fastest: " + std::to_string(fees.fastest) +
           "  |  30m: " + std::to_string(fees.halfHour) +
           "  |  1h: " + std::to_string(fees.hour) +
           "  |  Economy: " + std::to_string(fees.economy) +
           "  |  Minimum: " + std::to_string(fees.minimum);
}

std::string formatCurrentPriceLabel(double price) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "Current Price: $%.2f", price);
    return buffer;
}

}  // namespace ui
