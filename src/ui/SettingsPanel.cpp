#include "ui/SettingsPanel.h"

#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Window/Event.hpp>

#include <cstddef>
#include <memory>
#include <utility>

#include "config/EndpointUrl.h"
#include "logging/Log.h"
#include "ui/RenderManager.h"
#include "ui/ResourceProvider.h"

namespace ui {

namespace {
constexpr float kPanelWidth = 500.f;
constexpr float kPanelHeight = 230.f;
constexpr float kButtonHeight = 26.f;
constexpr std::size_t kMaxInputLength = 256;
constexpr std::size_t kVisibleInputChars = 44;

const sf::Color kShadeColor(0, 0, 0, 140);
const sf::Color kPanelColor(40, 40, 48);
const sf::Color kBorderColor(95, 95, 110);
const sf::Color kFieldColor(24, 24, 28);
const sf::Color kFieldFocusColor(70, 110, 170);
const sf::Color kButtonColor(62, 62, 74);
const sf::Color kDisabledColor(48, 48, 54);
const sf::Color kTextColor(225, 225, 230);
const sf::Color kMutedColor(130, 130, 140);
const sf::Color kStatusColor(230, 170, 80);

struct Button {
    sf::FloatRect bounds;
    std::string label;
    bool enabled;
};

void drawButton(sf::RenderTarget& target, const sf::Font* font, const Button& button) {
    sf::RectangleShape shape(sf::Vector2f(button.bounds.width, button.bounds.height));
    shape.setPosition(button.bounds.left, button.bounds.top);
    shape.setFillColor(button.enabled ? kButtonColor : kDisabledColor);
    shape.setOutlineColor(kBorderColor);
    shape.setOutlineThickness(1.f);
    target.draw(shape);
    if (!font) {
        return;
    }
    sf::Text text(button.label, *font, 14);
    text.setFillColor(button.enabled ? kTextColor : kMutedColor);
    const auto bounds = text.getLocalBounds();
    text.setOrigin(bounds.left + bounds.width / 2.f, bounds.top + bounds.height / 2.f);
    text.setPosition(button.bounds.left + button.bounds.width / 2.f, button.bounds.top + button.bounds.height / 2.f);
    target.draw(text);
}
}  // namespace

SettingsPanel::SettingsPanel(const config::SettingsStore& settings, CommandSink sink)
    : settings_(settings),
      sink_(std::move(sink)) {}

void SettingsPanel::open() {
    const auto current = settings_.snapshot();
    customEnabled_ = current.customEndpointEnabled;
    input_ = current.endpointUrl;
    inputFocused_ = false;
    status_.clear();
    open_ = true;
    LOG_DEBUG(logging::LogCategory::UI, "Settings panel opened");
}

void SettingsPanel::close() {
    open_ = false;
    inputFocused_ = false;
}

void SettingsPanel::layout(sf::Vector2u canvas) {
    const float left = (static_cast<float>(canvas.x) - kPanelWidth) / 2.f;
    const float top = (static_cast<float>(canvas.y) - kPanelHeight) / 2.f;
    panel_ = sf::FloatRect(left, top, kPanelWidth, kPanelHeight);
    toggle_ = sf::FloatRect(left + 16.f, top + 44.f, 16.f, 16.f);
    field_ = sf::FloatRect(left + 140.f, top + 76.f, kPanelWidth - 156.f, 24.f);
    applyButton_ = sf::FloatRect(left + 16.f, top + 114.f, 90.f, kButtonHeight);
    resetButton_ = sf::FloatRect(left + 116.f, top + 114.f, 140.f, kButtonHeight);
    closeButton_ = sf::FloatRect(left + kPanelWidth - 106.f, top + kPanelHeight - 40.f, 90.f, kButtonHeight);
}

void SettingsPanel::apply() {
    if (!customEnabled_ || input_.empty()) {
        return;
    }
    if (!config::normalizeEndpointUrl(input_)) {
        status_ = "Not a valid http(s) URL";
        return;
    }
    status_.clear();
    if (sink_) {
        sink_(app::Command::applyEndpointUrl(input_));
    }
}

void SettingsPanel::resetToDefault() {
    customEnabled_ = false;
    input_ = settings_.defaultEndpoint();
    status_.clear();
    if (sink_) {
        sink_(app::Command::resetEndpoint());
    }
}

bool SettingsPanel::handleEvent(const sf::Event& event) {
    if (!open_) {
        return false;
    }

    switch (event.type) {
    case sf::Event::MouseButtonPressed: {
        if (event.mouseButton.button != sf::Mouse::Left) {
            return true;
        }
        const float x = static_cast<float>(event.mouseButton.x);
        const float y = static_cast<float>(event.mouseButton.y);
        inputFocused_ = customEnabled_ && field_.contains(x, y);

        const sf::FloatRect toggleHit(toggle_.left, toggle_.top, 260.f, toggle_.height);
        if (toggleHit.contains(x, y)) {
            customEnabled_ = !customEnabled_;
            if (sink_) {
                sink_(app::Command::setCustomEndpoint(customEnabled_));
            }
        }
        else if (applyButton_.contains(x, y)) {
            apply();
        }
        else if (resetButton_.contains(x, y)) {
            resetToDefault();
        }
        else if (closeButton_.contains(x, y)) {
            close();
        }
        return true;
    }
    case sf::Event::TextEntered: {
        if (!inputFocused_) {
            return true;
        }
        const auto code = event.text.unicode;
        if (code == 8) {
            if (!input_.empty()) {
                input_.pop_back();
            }
        }
        else if (code >= 32 && code < 127 && input_.size() < kMaxInputLength) {
            input_.push_back(static_cast<char>(code));
        }
        return true;
    }
    case sf::Event::KeyPressed:
        if (event.key.code == sf::Keyboard::Escape) {
            close();
        }
        else if (event.key.code == sf::Keyboard::Return && inputFocused_) {
            apply();
        }
        return true;
    case sf::Event::KeyReleased:
    case sf::Event::MouseButtonReleased:
    case sf::Event::MouseMoved:
    case sf::Event::MouseWheelScrolled:
        return true;
    default:
        return false;
    }
}

void SettingsPanel::enqueueDraw(RenderManager& renderManager, ResourceProvider& resources, sf::Vector2u canvas) {
    if (!open_) {
        return;
    }
    layout(canvas);

    auto font = resources.getFont("ui");
    const std::string active = settings_.activeEndpoint();
    const bool enabled = customEnabled_;
    const bool focused = inputFocused_;
    const std::string input = input_;
    const std::string status = status_;
    const sf::FloatRect panel = panel_;
    const sf::FloatRect toggle = toggle_;
    const sf::FloatRect field = field_;
    const Button applyButton{applyButton_, "Apply", enabled && !input_.empty()};
    const Button reset{resetButton_, "Reset to Default", true};
    const Button closeBtn{closeButton_, "Close", true};

    renderManager.addRenderCommand(100, [=](sf::RenderTarget& target) {
        sf::RectangleShape shade(sf::Vector2f(static_cast<float>(target.getSize().x),
                                              static_cast<float>(target.getSize().y)));
        shade.setFillColor(kShadeColor);
        target.draw(shade);

        sf::RectangleShape background(sf::Vector2f(panel.width, panel.height));
        background.setPosition(panel.left, panel.top);
        background.setFillColor(kPanelColor);
        background.setOutlineColor(kBorderColor);
        background.setOutlineThickness(1.f);
        target.draw(background);

        sf::RectangleShape box(sf::Vector2f(toggle.width, toggle.height));
        box.setPosition(toggle.left, toggle.top);
        box.setFillColor(enabled ? kFieldFocusColor : kFieldColor);
        box.setOutlineColor(kBorderColor);
        box.setOutlineThickness(1.f);
        target.draw(box);

        sf::RectangleShape inputBox(sf::Vector2f(field.width, field.height));
        inputBox.setPosition(field.left, field.top);
        inputBox.setFillColor(enabled ? kFieldColor : kDisabledColor);
        inputBox.setOutlineColor(focused ? kFieldFocusColor : kBorderColor);
        inputBox.setOutlineThickness(1.f);
        target.draw(inputBox);

        drawButton(target, font.get(), applyButton);
        drawButton(target, font.get(), reset);
        drawButton(target, font.get(), closeBtn);

        if (!font) {
            return;
        }
        auto label = [&](const std::string& text, float x, float y, unsigned size, sf::Color color) {
            sf::Text t(text, *font, size);
            t.setFillColor(color);
            t.setPosition(x, y);
            target.draw(t);
        };
        label("Mempool Configuration", panel.left + 16.f, panel.top + 10.f, 18, kTextColor);
        label("Use custom mempool instance", toggle.left + 26.f, toggle.top - 2.f, 14, kTextColor);
        label("Mempool API URL:", panel.left + 16.f, field.top + 3.f, 14, enabled ? kTextColor : kMutedColor);
        const std::string shown = input.size() > kVisibleInputChars
            ? "..." + input.substr(input.size() - kVisibleInputChars)
            : input;
        label(shown + (focused ? "_" : ""), field.left + 6.f, field.top + 3.f, 14, enabled ? kTextColor : kMutedColor);
        if (!status.empty()) {
            label(status, panel.left + 270.f, panel.top + 118.f, 13, kStatusColor);
        }
        label("Currently using: " + active, panel.left + 16.f, panel.top + 160.f, 13, kMutedColor);
    });
}

}  // namespace ui
