#include "ui/PriceChart.h"

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Graphics/VertexArray.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "ui/MetricFormat.h"
#include "ui/RenderManager.h"

namespace ui {

namespace {
const sf::Color kBullishColor(48, 190, 120);
const sf::Color kBearishColor(220, 85, 85);
const sf::Color kGridColor(55, 66, 86, 120);
const sf::Color kAxisColor(120, 130, 150);
const sf::Color kLabelColor(210, 214, 228);
const sf::Color kTitleColor(235, 235, 240);
const sf::Color kPriceLineColor(255, 165, 0);

constexpr float kTitleHeight = 22.f;
constexpr float kPriceAxisWidth = 64.f;
constexpr float kTimeAxisHeight = 20.f;
constexpr std::size_t kPriceLabelCount = 5;
constexpr std::size_t kTimeLabelCount = 4;

struct CandleShape {
    float x;
    float top;
    float bottom;
    float wickTop;
    float wickBottom;
    bool bullish;
};
}  // namespace

void PriceChart::enqueue(RenderManager& renderManager,
                         const std::shared_ptr<sf::Font>& font,
                         const app::PriceHistoryView& view,
                         const app::MetricSnapshot& snapshot,
                         ChartArea area) {
    if (area.width <= kPriceAxisWidth || area.height <= kTitleHeight + kTimeAxisHeight) {
        return;
    }

    const std::string title = domain::timeframe_chart_title(snapshot.timeframe);
    if (font) {
        renderManager.addRenderCommand(15, [font, title, area](sf::RenderTarget& target) {
            sf::Text text(title, *font, 15);
            text.setFillColor(kTitleColor);
            const auto bounds = text.getLocalBounds();
            text.setOrigin(bounds.left + bounds.width / 2.f, bounds.top);
            text.setPosition(area.left + area.width / 2.f, area.top + 2.f);
            target.draw(text);
        });
    }

    const auto points = visiblePoints(view.buffer(), view.bounds());
    if (points.empty()) {
        return;
    }

    const ChartArea plot{area.left,
                         area.top + kTitleHeight,
                         area.width - kPriceAxisWidth,
                         area.height - kTitleHeight - kTimeAxisHeight};
    const PriceRange range = paddedPriceRange(points, snapshot.price);
    const ChartGeometry geometry(plot, view.bounds(), range);

    std::vector<CandleShape> candles;
    candles.reserve(points.size());
    for (const auto* point : points) {
        const auto& c = point->candle;
        const float openY = geometry.yFor(c.open);
        const float closeY = geometry.yFor(c.close);
        candles.push_back(CandleShape{geometry.xFor(point->time.raw),
                                      std::min(openY, closeY),
                                      std::max(openY, closeY),
                                      geometry.yFor(c.high),
                                      geometry.yFor(c.low),
                                      c.close >= c.open});
    }
    const float bodyWidth = geometry.candleWidth(candles.size());
    const auto priceLabels = geometry.priceLabels(kPriceLabelCount);
    const auto timeLabels = geometry.timeLabels(kTimeLabelCount);

    renderManager.addRenderCommand(5, [plot, priceLabels, timeLabels](sf::RenderTarget& target) {
        sf::VertexArray grid(sf::Lines);
        for (const auto& label : priceLabels) {
            grid.append(sf::Vertex(sf::Vector2f(plot.left, label.position), kGridColor));
            grid.append(sf::Vertex(sf::Vector2f(plot.right(), label.position), kGridColor));
        }
        for (const auto& label : timeLabels) {
            grid.append(sf::Vertex(sf::Vector2f(label.position, plot.top), kGridColor));
            grid.append(sf::Vertex(sf::Vector2f(label.position, plot.bottom()), kGridColor));
        }
        grid.append(sf::Vertex(sf::Vector2f(plot.right(), plot.top), kAxisColor));
        grid.append(sf::Vertex(sf::Vector2f(plot.right(), plot.bottom()), kAxisColor));
        grid.append(sf::Vertex(sf::Vector2f(plot.left, plot.bottom()), kAxisColor));
        grid.append(sf::Vertex(sf::Vector2f(plot.right(), plot.bottom()), kAxisColor));
        target.draw(grid);
    });

    renderManager.addRenderCommand(8, [candles](sf::RenderTarget& target) {
        sf::VertexArray wicks(sf::Lines, candles.size() * 2);
        std::size_t index = 0;
        for (const auto& candle : candles) {
            const sf::Color color = candle.bullish ? kBullishColor : kBearishColor;
            wicks[index].position = sf::Vector2f(candle.x, candle.wickTop);
            wicks[index++].color = color;
            wicks[index].position = sf::Vector2f(candle.x, candle.wickBottom);
            wicks[index++].color = color;
        }
        target.draw(wicks);
    });

    renderManager.addRenderCommand(10, [candles, bodyWidth](sf::RenderTarget& target) {
        sf::RectangleShape body;
        for (const auto& candle : candles) {
            body.setSize(sf::Vector2f(bodyWidth, std::max(1.f, candle.bottom - candle.top)));
            body.setOrigin(bodyWidth / 2.f, 0.f);
            body.setPosition(candle.x, candle.top);
            body.setFillColor(candle.bullish ? kBullishColor : kBearishColor);
            target.draw(body);
        }
    });

    if (snapshot.price > 0.0) {
        const float lineY = geometry.yFor(snapshot.price);
        const std::string lineLabel = formatCurrentPriceLabel(snapshot.price);
        renderManager.addRenderCommand(12, [plot, lineY, lineLabel, font](sf::RenderTarget& target) {
            sf::VertexArray line(sf::Lines, 2);
            line[0] = sf::Vertex(sf::Vector2f(plot.left, lineY), kPriceLineColor);
            line[1] = sf::Vertex(sf::Vector2f(plot.right(), lineY), kPriceLineColor);
            target.draw(line);
            if (!font) {
                return;
            }
            sf::Text text(lineLabel, *font, 12);
            text.setFillColor(kPriceLineColor);
            text.setPosition(plot.left + 4.f, lineY - 16.f);
            target.draw(text);
        });
    }

    if (!font) {
        return;
    }
    renderManager.addRenderCommand(15, [plot, priceLabels, timeLabels, font](sf::RenderTarget& target) {
        sf::Text text;
        text.setFont(*font);
        text.setFillColor(kLabelColor);
        text.setCharacterSize(11);
        for (const auto& label : priceLabels) {
            text.setString(label.text);
            const auto bounds = text.getLocalBounds();
            text.setOrigin(bounds.left, bounds.top + bounds.height / 2.f);
            text.setPosition(plot.right() + 6.f, label.position);
            target.draw(text);
        }
        for (std::size_t i = 0; i < timeLabels.size(); ++i) {
            const auto& label = timeLabels[i];
            text.setString(label.text);
            const auto bounds = text.getLocalBounds();
            float originX = bounds.left + bounds.width / 2.f;
            if (i == 0) {
                originX = bounds.left;
            }
            else if (i + 1 == timeLabels.size()) {
                originX = bounds.left + bounds.width;
            }
            text.setOrigin(originX, bounds.top);
            text.setPosition(label.position, plot.bottom() + 4.f);
            target.draw(text);
        }
    });
}

}  // namespace ui
