#pragma once

#include <string>

#include "app/SharedState.h"

namespace ui {

inline constexpr const char* kLoadingText = "Loading...";
inline constexpr double kSatsPerBitcoin = 100'000'000.0;

// "$67250.12 | 1487 sats/$", or the loading placeholder while price is unset.
std::string formatPriceHeadline(double price);
std::string formatLastUpdated(const app::MetricSnapshot& snapshot);

std::string formatBlockLine(const app::MetricSnapshot& snapshot);
std::string formatFeeLine(const app::MetricSnapshot& snapshot);

// "Current Price: $67250.12" label of the horizontal price line.
std::string formatCurrentPriceLabel(double price);

}  // namespace ui
