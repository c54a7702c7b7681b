#include "ui/HUD.h"

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>

#include <memory>
#include <string>

#include "logging/Log.h"
#include "ui/MetricFormat.h"
#include "ui/ResourceProvider.h"

namespace ui {

namespace {
const sf::Color kPanelColor(33, 33, 38);
const sf::Color kSeparatorColor(60, 60, 70);
const sf::Color kHeadingColor(240, 240, 245);
const sf::Color kTextColor(200, 200, 210);
const sf::Color kFallbackColor(230, 170, 80);
const sf::Color kPriceColor(255, 165, 0);
}  // namespace

void HUD::drawNetworkPanel(sf::RenderTarget& target,
                           const app::MetricSnapshot& snapshot,
                           ResourceProvider& resourceProvider,
                           float top) {
    const sf::Vector2u windowSize = target.getSize();
    if (windowSize.x == 0 || windowSize.y == 0) {
        return;
    }

    sf::RectangleShape rect(sf::Vector2f(static_cast<float>(windowSize.x), kNetworkPanelHeight));
    rect.setPosition(0.f, top);
    rect.setFillColor(kPanelColor);
    target.draw(rect);

    sf::RectangleShape separator(sf::Vector2f(static_cast<float>(windowSize.x) - 24.f, 1.f));
    separator.setPosition(12.f, top + kNetworkPanelHeight - 1.f);
    separator.setFillColor(kSeparatorColor);
    target.draw(separator);

    auto font = resourceProvider.getFont("ui");
    if (!font) {
        if (!fontWarningLogged_) {
            LOG_WARN(logging::LogCategory::UI, "HUD: font not available, panels drawn without text");
            fontWarningLogged_ = true;
        }
        return;
    }

    sf::Text heading("Bitcoin Network", *font, 16);
    heading.setFillColor(kHeadingColor);
    heading.setStyle(sf::Text::Bold);
    heading.setPosition(12.f, top + 4.f);
    target.draw(heading);

    sf::Text block(formatBlockLine(snapshot), *font, 13);
    block.setFillColor(kTextColor);
    block.setPosition(12.f, top + 25.f);
    target.draw(block);

    sf::Text fees(formatFeeLine(snapshot), *font, 13);
    fees.setFillColor(kTextColor);
    fees.setPosition(12.f, top + 42.f);
    target.draw(fees);
}

void HUD::drawPricePanel(sf::RenderTarget& target,
                         const app::MetricSnapshot& snapshot,
                         ResourceProvider& resourceProvider,
                         float top) {
    const sf::Vector2u windowSize = target.getSize();
    auto font = resourceProvider.getFont("ui");
    if (!font || windowSize.x == 0) {
        return;
    }
    const float centerX = static_cast<float>(windowSize.x) / 2.f;

    sf::Text price(formatPriceHeadline(snapshot.price), *font, 24);
    price.setFillColor(snapshot.price > 0.0 ? kPriceColor : kTextColor);
    price.setStyle(sf::Text::Bold);
    auto bounds = price.getLocalBounds();
    price.setOrigin(bounds.left + bounds.width / 2.f, bounds.top);
    price.setPosition(centerX, top + 8.f);
    target.draw(price);

    sf::Text updated(formatLastUpdated(snapshot), *font, 13);
    updated.setFillColor(snapshot.priceIsFallback ? kFallbackColor : kTextColor);
    bounds = updated.getLocalBounds();
    updated.setOrigin(bounds.left + bounds.width / 2.f, bounds.top);
    updated.setPosition(centerX, top + 42.f);
    target.draw(updated);
}

}  // namespace ui
