#pragma once

#include <SFML/Graphics/Font.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ui {

class ResourceProvider {
public:
    struct FontResource {
        std::shared_ptr<sf::Font> font;
        bool ready{false};
    };

    ResourceProvider();

    FontResource getFontResource(const std::string& key);

    // nullptr when no candidate file could be loaded.
    std::shared_ptr<sf::Font> getFont(const std::string& key);

private:
    FontResource loadFontUnlocked(const std::string& key);
    std::vector<std::filesystem::path> candidateFontPaths(const std::string& key) const;

    std::unordered_map<std::string, FontResource> fonts_;
    std::mutex fontMutex_;
    std::filesystem::path projectRoot_;
};

}  // namespace ui
