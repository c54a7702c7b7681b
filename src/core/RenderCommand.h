#pragma once

#include <functional>
#include <utility>

namespace sf {
class RenderTarget;
}

namespace core {

struct RenderCommand {
    int zIndex{0};
    std::function<void(sf::RenderTarget&)> drawFunc;

    RenderCommand(int z, std::function<void(sf::RenderTarget&)> func)
        : zIndex(z),
          drawFunc(std::move(func)) {}
};

}  // namespace core
