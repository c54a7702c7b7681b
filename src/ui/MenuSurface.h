#pragma once

#include <functional>
#include <optional>

#include "domain/Types.h"

namespace sf {
class Event;
}

namespace ui {

class RenderManager;
class ResourceProvider;

enum class MenuAction {
    RefreshPrice,
    RefreshNetwork,
    Timeframe24h,
    TimeframeWeek,
    TimeframeMonth,
    TimeframeYear,
    OpenSettings,
    Quit,
};

const char* menu_action_label(MenuAction action);
std::optional<domain::Timeframe> menu_action_timeframe(MenuAction action);

// The tray/menu capability. Implementations turn user input into
// MenuActions; the owner decides what each action does.
class MenuSurface {
public:
    using ActionHandler = std::function<void(MenuAction)>;

    virtual ~MenuSurface() = default;

    virtual void setActionHandler(ActionHandler handler) = 0;
    virtual void setActiveTimeframe(domain::Timeframe timeframe) = 0;

    // Returns true when the event was consumed.
    virtual bool handleEvent(const sf::Event& event) = 0;
    virtual void enqueueDraw(RenderManager& renderManager, ResourceProvider& resources) = 0;

    // Vertical space reserved at the top of the window.
    virtual float height() const = 0;
};

}  // namespace ui
