#pragma once

#include <SFML/Graphics/Rect.hpp>
#include <SFML/Window/Keyboard.hpp>

#include <optional>
#include <vector>

#include "ui/MenuSurface.h"

namespace ui {

// In-window rendition of the tray menu: a bar with a "Menu" button that
// opens a dropdown, plus single-key shortcuts (R, M, 1-4, S, Q).
class WindowMenu : public MenuSurface {
public:
    WindowMenu();

    void setActionHandler(ActionHandler handler) override;
    void setActiveTimeframe(domain::Timeframe timeframe) override;
    bool handleEvent(const sf::Event& event) override;
    void enqueueDraw(RenderManager& renderManager, ResourceProvider& resources) override;
    float height() const override;

    bool isOpen() const { return open_; }

private:
    struct Item {
        std::optional<MenuAction> action;  // nullopt for a separator
        const char* shortcut;
        sf::FloatRect bounds;
    };

    void layout();
    void trigger(MenuAction action);
    std::optional<MenuAction> actionAt(float x, float y) const;
    static std::optional<MenuAction> shortcutAction(sf::Keyboard::Key key);

    ActionHandler handler_;
    std::vector<Item> items_;
    sf::FloatRect buttonBounds_;
    sf::FloatRect dropdownBounds_;
    domain::Timeframe activeTimeframe_{domain::Timeframe::Hours24};
    std::optional<MenuAction> hovered_;
    bool open_{false};
};

}  // namespace ui
