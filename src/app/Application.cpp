#include "app/Application.h"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/Window/Event.hpp>

#include "app/CommandDispatcher.h"
#include "config/SettingsStore.h"
#include "logging/Log.h"
#include "ui/RenderManager.h"
#include "ui/ResourceProvider.h"
#include "ui/SettingsPanel.h"
#include "ui/WindowMenu.h"

#include <utility>

namespace {
constexpr const char* kWindowTitle = "Bitcoin Metrics";
const sf::Time kRedrawInterval = sf::seconds(1.f);
const sf::Time kIdleSleep = sf::milliseconds(25);
constexpr float kChartMargin = 10.f;
}  // namespace

namespace app {

Application::Application(const config::Config& config,
                         SharedState& state,
                         CommandDispatcher& dispatcher,
                         const config::SettingsStore& settings)
    : config_(config),
      state_(state),
      dispatcher_(dispatcher),
      window_(std::make_unique<sf::RenderWindow>(
          sf::VideoMode(static_cast<unsigned>(config.windowWidth), static_cast<unsigned>(config.windowHeight)),
          kWindowTitle)),
      renderManager_(std::make_unique<ui::RenderManager>()),
      resourceProvider_(std::make_unique<ui::ResourceProvider>()),
      menu_(std::make_unique<ui::WindowMenu>()) {
    settingsPanel_ = std::make_unique<ui::SettingsPanel>(settings, [this](Command command) {
        postCommand(std::move(command));
    });
    menu_->setActionHandler([this](ui::MenuAction action) { onMenuAction(action); });
    menu_->setActiveTimeframe(state_.timeframe());

    window_->setFramerateLimit(30);
    window_->setKeyRepeatEnabled(false);
    LOG_INFO(logging::LogCategory::UI,
             "Window %dx%d ready",
             config_.windowWidth,
             config_.windowHeight);
}

Application::~Application() = default;

void Application::run() {
    sf::Clock sinceRedraw;
    bool dirty = true;
    sf::Event e;
    while (window_->isOpen()) {
        while (window_->pollEvent(e)) {
            if (e.type == sf::Event::Closed) {
                LOG_INFO(logging::LogCategory::UI, "Window closed");
                window_->close();
                break;
            }
            handleEvent(e);
            dirty = true;
        }
        if (!window_->isOpen()) {
            break;
        }

        if (!dirty && sinceRedraw.getElapsedTime() < kRedrawInterval) {
            sf::sleep(kIdleSleep);
            continue;
        }

        enqueueFrame();
        renderManager_->render(*window_);
        window_->display();
        sinceRedraw.restart();
        dirty = false;
    }
}

void Application::handleEvent(const sf::Event& event) {
    if (event.type == sf::Event::Resized) {
        renderManager_->onResize(sf::Vector2u(event.size.width, event.size.height));
        return;
    }
    if (settingsPanel_->handleEvent(event)) {
        return;
    }
    menu_->handleEvent(event);
}

void Application::onMenuAction(ui::MenuAction action) {
    if (const auto timeframe = ui::menu_action_timeframe(action)) {
        postCommand(Command::selectTimeframe(*timeframe));
        return;
    }

    switch (action) {
    case ui::MenuAction::RefreshPrice:
        postCommand(Command::refreshPrice());
        break;
    case ui::MenuAction::RefreshNetwork:
        postCommand(Command::refreshNetwork());
        break;
    case ui::MenuAction::OpenSettings:
        settingsPanel_->open();
        break;
    case ui::MenuAction::Quit:
        LOG_INFO(logging::LogCategory::UI, "Quit requested");
        window_->close();
        break;
    default:
        break;
    }
}

void Application::postCommand(Command command) {
    const auto kind = command.kind;
    if (!dispatcher_.post(std::move(command))) {
        LOG_WARN(logging::LogCategory::UI, "Command %s dropped, dispatcher stopped", command_kind_to_string(kind));
    }
}

void Application::enqueueFrame() {
    const auto size = window_->getSize();
    if (size.x == 0 || size.y == 0) {
        return;
    }

    lastSnapshot_ = historyView_.tick(state_);
    menu_->setActiveTimeframe(lastSnapshot_.timeframe);

    const float networkTop = menu_->height();
    const float priceTop = networkTop + ui::HUD::kNetworkPanelHeight;
    const float chartTop = priceTop + ui::HUD::kPricePanelHeight;

    ui::HUD* hud = &hud_;
    ui::ResourceProvider* rp = resourceProvider_.get();
    const MetricSnapshot snapshot = lastSnapshot_;
    renderManager_->addRenderCommand(2, [hud, rp, snapshot, networkTop, priceTop](sf::RenderTarget& target) {
        hud->drawNetworkPanel(target, snapshot, *rp, networkTop);
        hud->drawPricePanel(target, snapshot, *rp, priceTop);
    });

    const ui::ChartArea area{kChartMargin,
                             chartTop,
                             static_cast<float>(size.x) - 2.f * kChartMargin,
                             static_cast<float>(size.y) - chartTop - kChartMargin};
    chart_.enqueue(*renderManager_, resourceProvider_->getFont("ui"), historyView_, lastSnapshot_, area);

    menu_->enqueueDraw(*renderManager_, *resourceProvider_);
    settingsPanel_->enqueueDraw(*renderManager_, *resourceProvider_, size);
}

}  // namespace app
