#include "ui/ResourceProvider.h"

#include "logging/Log.h"

#include <array>

namespace ui {

ResourceProvider::ResourceProvider()
    : projectRoot_(std::filesystem::current_path()) {}

ResourceProvider::FontResource ResourceProvider::getFontResource(const std::string& key) {
    std::lock_guard<std::mutex> lock(fontMutex_);
    if (auto it = fonts_.find(key); it != fonts_.end()) {
        return it->second;
    }
    auto loaded = loadFontUnlocked(key);
    fonts_.emplace(key, loaded);
    return loaded;
}

std::shared_ptr<sf::Font> ResourceProvider::getFont(const std::string& key) {
    auto resource = getFontResource(key);
    return resource.ready ? resource.font : nullptr;
}

ResourceProvider::FontResource ResourceProvider::loadFontUnlocked(const std::string& key) {
    FontResource resource;
    resource.font = std::make_shared<sf::Font>();
    for (const auto& path : candidateFontPaths(key)) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && resource.font->loadFromFile(path.string())) {
            LOG_DEBUG(logging::LogCategory::UI, "Loaded font from %s", path.string().c_str());
            resource.ready = true;
            return resource;
        }
    }

    LOG_DEBUG(logging::LogCategory::UI, "No bundled font for key %s, trying system fonts", key.c_str());
    static const std::array<const char*, 4> systemCandidates{
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf"
    };

    for (const char* candidate : systemCandidates) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && resource.font->loadFromFile(candidate)) {
            LOG_INFO(logging::LogCategory::UI, "Loaded system font from %s", candidate);
            resource.ready = true;
            return resource;
        }
    }

    LOG_ERROR(logging::LogCategory::UI, "Unable to load font for key %s. Text rendering will be degraded.", key.c_str());
    return resource;
}

std::vector<std::filesystem::path> ResourceProvider::candidateFontPaths(const std::string& key) const {
    std::vector<std::filesystem::path> paths;
    if (key == "ui" || key == "default") {
        paths.emplace_back(projectRoot_ / "assets" / "DejaVuSans.ttf");
        paths.emplace_back(projectRoot_ / "resources" / "DejaVuSans.ttf");
        paths.emplace_back(projectRoot_ / "DejaVuSans.ttf");
    }
    else {
        paths.emplace_back(projectRoot_ / key);
        paths.emplace_back(projectRoot_ / "assets" / key);
        paths.emplace_back(projectRoot_ / "resources" / key);
    }
    return paths;
}

}  // namespace ui
