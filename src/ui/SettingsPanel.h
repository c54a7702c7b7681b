#pragma once

#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

#include <functional>
#include <string>

#include "app/CommandDispatcher.h"
#include "config/SettingsStore.h"

namespace sf {
class Event;
}

namespace ui {

class RenderManager;
class ResourceProvider;

// Modal "Mempool Configuration" panel. Reads the settings store for display
// and emits commands; it never writes settings itself.
class SettingsPanel {
public:
    using CommandSink = std::function<void(app::Command)>;

    SettingsPanel(const config::SettingsStore& settings, CommandSink sink);

    void open();
    void close();
    bool isOpen() const { return open_; }

    // Consumes every input event while open.
    bool handleEvent(const sf::Event& event);
    void enqueueDraw(RenderManager& renderManager, ResourceProvider& resources, sf::Vector2u canvas);

private:
    void layout(sf::Vector2u canvas);
    void apply();
    void resetToDefault();

    const config::SettingsStore& settings_;
    CommandSink sink_;

    bool open_{false};
    bool inputFocused_{false};
    // Local view of the toggle until the dispatcher persists it.
    bool customEnabled_{false};
    std::string input_;
    std::string status_;

    sf::FloatRect panel_;
    sf::FloatRect toggle_;
    sf::FloatRect field_;
    sf::FloatRect applyButton_;
    sf::FloatRect resetButton_;
    sf::FloatRect closeButton_;
};

}  // namespace ui
