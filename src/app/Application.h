#pragma once

#include "app/PriceHistoryView.h"
#include "app/SharedState.h"
#include "config/Config.h"
#include "ui/HUD.h"
#include "ui/MenuSurface.h"
#include "ui/PriceChart.h"

#include <SFML/Window/Event.hpp>

#include <memory>

namespace sf {
class RenderWindow;
}

namespace config {
class SettingsStore;
}

namespace ui {
class RenderManager;
class ResourceProvider;
class SettingsPanel;
}

namespace app {

class CommandDispatcher;
struct Command;

// Owns the window and the render thread. Reads SharedState once per tick,
// forwards menu input to the dispatcher and never touches the network.
class Application {
public:
    Application(const config::Config& config,
                SharedState& state,
                CommandDispatcher& dispatcher,
                const config::SettingsStore& settings);
    ~Application();

    // Returns when the window closes or Quit is chosen.
    void run();

private:
    void handleEvent(const sf::Event& event);
    void onMenuAction(ui::MenuAction action);
    void postCommand(Command command);
    void enqueueFrame();

    config::Config config_;
    SharedState& state_;
    CommandDispatcher& dispatcher_;

    std::unique_ptr<sf::RenderWindow> window_;
    std::unique_ptr<ui::RenderManager> renderManager_;
    std::unique_ptr<ui::ResourceProvider> resourceProvider_;
    std::unique_ptr<ui::MenuSurface> menu_;
    std::unique_ptr<ui::SettingsPanel> settingsPanel_;

    PriceHistoryView historyView_;
    MetricSnapshot lastSnapshot_;
    ui::HUD hud_;
    ui::PriceChart chart_;
};

}  // namespace app
