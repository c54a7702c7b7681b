#include "ui/WindowMenu.h"

#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Window/Event.hpp>

#include <memory>
#include <string>
#include <utility>

#include "logging/Log.h"
#include "ui/RenderManager.h"
#include "ui/ResourceProvider.h"

namespace ui {

namespace {
constexpr float kBarHeight = 26.f;
constexpr float kButtonWidth = 64.f;
constexpr float kDropdownWidth = 250.f;
constexpr float kItemHeight = 24.f;
constexpr float kSeparatorHeight = 9.f;
constexpr unsigned kFontSize = 14;

const sf::Color kBarColor(38, 38, 44);
const sf::Color kButtonColor(58, 58, 66);
const sf::Color kDropdownColor(44, 44, 52, 245);
const sf::Color kHoverColor(70, 100, 150);
const sf::Color kSeparatorColor(80, 80, 90);
const sf::Color kTextColor(225, 225, 230);
const sf::Color kHintColor(150, 150, 160);
const sf::Color kBorderColor(90, 90, 100);
}  // namespace

const char* menu_action_label(MenuAction action) {
    switch (action) {
    case MenuAction::RefreshPrice:
        return "Refresh BTC Price";
    case MenuAction::RefreshNetwork:
        return "Refresh Mempool Data";
    case MenuAction::Timeframe24h:
        return "24 Hours";
    case MenuAction::TimeframeWeek:
        return "1 Week";
    case MenuAction::TimeframeMonth:
        return "1 Month";
    case MenuAction::TimeframeYear:
        return "1 Year";
    case MenuAction::OpenSettings:
        return "Mempool Configuration";
    case MenuAction::Quit:
        return "Quit";
    }
    return "";
}

std::optional<domain::Timeframe> menu_action_timeframe(MenuAction action) {
    switch (action) {
    case MenuAction::Timeframe24h:
        return domain::Timeframe::Hours24;
    case MenuAction::TimeframeWeek:
        return domain::Timeframe::Week;
    case MenuAction::TimeframeMonth:
        return domain::Timeframe::Month;
    case MenuAction::TimeframeYear:
        return domain::Timeframe::Year;
    default:
        return std::nullopt;
    }
}

WindowMenu::WindowMenu() {
    items_ = {
        {MenuAction::RefreshPrice, "R", {}},
        {MenuAction::RefreshNetwork, "M", {}},
        {std::nullopt, "", {}},
        {MenuAction::Timeframe24h, "1", {}},
        {MenuAction::TimeframeWeek, "2", {}},
        {MenuAction::TimeframeMonth, "3", {}},
        {MenuAction::TimeframeYear, "4", {}},
        {std::nullopt, "", {}},
        {MenuAction::OpenSettings, "S", {}},
        {std::nullopt, "", {}},
        {MenuAction::Quit, "Q", {}},
    };
    layout();
}

void WindowMenu::setActionHandler(ActionHandler handler) {
    handler_ = std::move(handler);
}

void WindowMenu::setActiveTimeframe(domain::Timeframe timeframe) {
    activeTimeframe_ = timeframe;
}

float WindowMenu::height() const {
    return kBarHeight;
}

void WindowMenu::layout() {
    buttonBounds_ = sf::FloatRect(4.f, 3.f, kButtonWidth, kBarHeight - 6.f);

    float y = kBarHeight;
    for (auto& item : items_) {
        const float h = item.action ? kItemHeight : kSeparatorHeight;
        item.bounds = sf::FloatRect(4.f, y, kDropdownWidth, h);
        y += h;
    }
    dropdownBounds_ = sf::FloatRect(4.f, kBarHeight, kDropdownWidth, y - kBarHeight);
}

std::optional<MenuAction> WindowMenu::actionAt(float x, float y) const {
    for (const auto& item : items_) {
        if (item.action && item.bounds.contains(x, y)) {
            return item.action;
        }
    }
    return std::nullopt;
}

std::optional<MenuAction> WindowMenu::shortcutAction(sf::Keyboard::Key key) {
    switch (key) {
    case sf::Keyboard::R:
        return MenuAction::RefreshPrice;
    case sf::Keyboard::M:
        return MenuAction::RefreshNetwork;
    case sf::Keyboard::Num1:
        return MenuAction::Timeframe24h;
    case sf::Keyboard::Num2:
        return MenuAction::TimeframeWeek;
    case sf::Keyboard::Num3:
        return MenuAction::TimeframeMonth;
    case sf::Keyboard::Num4:
        return MenuAction::TimeframeYear;
    case sf::Keyboard::S:
        return MenuAction::OpenSettings;
    case sf::Keyboard::Q:
        return MenuAction::Quit;
    default:
        return std::nullopt;
    }
}

void WindowMenu::trigger(MenuAction action) {
    open_ = false;
    hovered_.reset();
    LOG_DEBUG(logging::LogCategory::UI, "Menu action: %s", menu_action_label(action));
    if (handler_) {
        handler_(action);
    }
}

bool WindowMenu::handleEvent(const sf::Event& event) {
    switch (event.type) {
    case sf::Event::MouseButtonPressed: {
        if (event.mouseButton.button != sf::Mouse::Left) {
            return false;
        }
        const float x = static_cast<float>(event.mouseButton.x);
        const float y = static_cast<float>(event.mouseButton.y);
        if (buttonBounds_.contains(x, y)) {
            open_ = !open_;
            return true;
        }
        if (open_) {
            if (auto action = actionAt(x, y)) {
                trigger(*action);
                return true;
            }
            open_ = false;
            return dropdownBounds_.contains(x, y);
        }
        return false;
    }
    case sf::Event::MouseMoved:
        if (open_) {
            hovered_ = actionAt(static_cast<float>(event.mouseMove.x), static_cast<float>(event.mouseMove.y));
            return true;
        }
        return false;
    case sf::Event::KeyPressed:
        if (event.key.code == sf::Keyboard::Escape && open_) {
            open_ = false;
            return true;
        }
        if (event.key.control || event.key.alt || event.key.system) {
            return false;
        }
        if (auto action = shortcutAction(event.key.code)) {
            trigger(*action);
            return true;
        }
        return false;
    default:
        return false;
    }
}

void WindowMenu::enqueueDraw(RenderManager& renderManager, ResourceProvider& resources) {
    auto font = resources.getFont("ui");
    const sf::FloatRect button = buttonBounds_;
    const bool open = open_;

    renderManager.addRenderCommand(80, [font, button, open](sf::RenderTarget& target) {
        sf::RectangleShape bar(sf::Vector2f(static_cast<float>(target.getSize().x), kBarHeight));
        bar.setFillColor(kBarColor);
        target.draw(bar);

        sf::RectangleShape buttonShape(sf::Vector2f(button.width, button.height));
        buttonShape.setPosition(button.left, button.top);
        buttonShape.setFillColor(open ? kHoverColor : kButtonColor);
        target.draw(buttonShape);

        if (!font) {
            return;
        }
        sf::Text label("Menu", *font, kFontSize);
        label.setFillColor(kTextColor);
        label.setPosition(button.left + 12.f, button.top + 1.f);
        target.draw(label);

        sf::Text hint("R refresh   M mempool   1-4 timeframe   S settings   Q quit", *font, 12);
        hint.setFillColor(kHintColor);
        hint.setPosition(button.left + button.width + 14.f, button.top + 3.f);
        target.draw(hint);
    });

    if (!open_) {
        return;
    }

    struct DrawItem {
        bool separator;
        std::string label;
        std::string shortcut;
        sf::FloatRect bounds;
        bool hovered;
    };
    std::vector<DrawItem> drawItems;
    drawItems.reserve(items_.size());
    for (const auto& item : items_) {
        if (!item.action) {
            drawItems.push_back(DrawItem{true, {}, {}, item.bounds, false});
            continue;
        }
        std::string label = menu_action_label(*item.action);
        const auto timeframe = menu_action_timeframe(*item.action);
        label = (timeframe && *timeframe == activeTimeframe_ ? "* " : "  ") + label;
        drawItems.push_back(DrawItem{false, label, item.shortcut, item.bounds, hovered_ == item.action});
    }
    const sf::FloatRect dropdown = dropdownBounds_;

    renderManager.addRenderCommand(95, [font, dropdown, drawItems](sf::RenderTarget& target) {
        sf::RectangleShape background(sf::Vector2f(dropdown.width, dropdown.height));
        background.setPosition(dropdown.left, dropdown.top);
        background.setFillColor(kDropdownColor);
        background.setOutlineColor(kBorderColor);
        background.setOutlineThickness(1.f);
        target.draw(background);

        for (const auto& item : drawItems) {
            if (item.separator) {
                sf::RectangleShape line(sf::Vector2f(item.bounds.width - 12.f, 1.f));
                line.setPosition(item.bounds.left + 6.f, item.bounds.top + item.bounds.height / 2.f);
                line.setFillColor(kSeparatorColor);
                target.draw(line);
                continue;
            }
            if (item.hovered) {
                sf::RectangleShape highlight(sf::Vector2f(item.bounds.width, item.bounds.height));
                highlight.setPosition(item.bounds.left, item.bounds.top);
                highlight.setFillColor(kHoverColor);
                target.draw(highlight);
            }
            if (!font) {
                continue;
            }
            sf::Text text(item.label, *font, kFontSize);
            text.setFillColor(kTextColor);
            text.setPosition(item.bounds.left + 8.f, item.bounds.top + 3.f);
            target.draw(text);

            sf::Text shortcut(item.shortcut, *font, kFontSize);
            shortcut.setFillColor(kHintColor);
            shortcut.setPosition(item.bounds.left + item.bounds.width - 24.f, item.bounds.top + 3.f);
            target.draw(shortcut);
        }
    });
}

}  // namespace ui
