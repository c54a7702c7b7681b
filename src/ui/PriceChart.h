#pragma once

#include <memory>

#include "app/PriceHistoryView.h"
#include "ui/ChartGeometry.h"

namespace sf {
class Font;
}

namespace ui {

class RenderManager;

// Candlestick chart of the display buffer with a current-price line.
class PriceChart {
public:
    void enqueue(RenderManager& renderManager,
                 const std::shared_ptr<sf::Font>& font,
                 const app::PriceHistoryView& view,
                 const app::MetricSnapshot& snapshot,
                 ChartArea area);
};

}  // namespace ui
