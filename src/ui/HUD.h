#pragma once

#include <SFML/Graphics/RenderTarget.hpp>

#include "app/SharedState.h"

namespace ui {

class ResourceProvider;

// Network and price panels above the chart.
class HUD {
public:
    static constexpr float kNetworkPanelHeight = 64.f;
    static constexpr float kPricePanelHeight = 62.f;

    void drawNetworkPanel(sf::RenderTarget& target,
                          const app::MetricSnapshot& snapshot,
                          ResourceProvider& resourceProvider,
                          float top);

    void drawPricePanel(sf::RenderTarget& target,
                        const app::MetricSnapshot& snapshot,
                        ResourceProvider& resourceProvider,
                        float top);

private:
    bool fontWarningLogged_{false};
};

}  // namespace ui
