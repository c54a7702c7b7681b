#pragma once

#include <SFML/Graphics.hpp>
#include <SFML/Graphics/View.hpp>

#include <functional>
#include <vector>

#include "core/RenderCommand.h"

namespace ui {

// Collects draw callbacks for one frame and replays them by z-index.
class RenderManager {
public:
    RenderManager();
    ~RenderManager();

    void addRenderCommand(int z, std::function<void(sf::RenderTarget&)> func);

    // Clears the window, draws every queued command and empties the queue.
    void render(sf::RenderWindow& window);

    bool hasCommands() const;

    void onResize(sf::Vector2u size);

private:
    std::vector<core::RenderCommand> commands_;
    sf::Vector2u canvasSize_;
    sf::View windowView_;
    bool viewDirty_{true};
};

}  // namespace ui
