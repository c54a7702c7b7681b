#include "config/SettingsStore.h"

#include "config/EndpointUrl.h"
#include "logging/Log.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

namespace config {

namespace {

namespace fs = std::filesystem;
namespace json = boost::json;

constexpr const char* kAppDirName = "btcticker";
constexpr const char* kFileName = "config.json";
constexpr const char* kKeyCustomEnabled = "mempool_custom_url_enabled";
constexpr const char* kKeyEndpointUrl = "mempool_api_url";

fs::path userConfigBase() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config";
    }
    return {};
}

std::string toPrettyJson(const Settings& settings) {
    std::ostringstream out;
    out << "{\n"
        << "  \"" << kKeyCustomEnabled << "\": " << json::serialize(json::value(settings.customEndpointEnabled))
        << ",\n"
        << "  \"" << kKeyEndpointUrl << "\": " << json::serialize(json::value(settings.endpointUrl.c_str())) << "\n"
        << "}\n";
    return out.str();
}

bool fromJson(const std::string& text, Settings& out) {
    json::error_code ec;
    const json::value root = json::parse(text, ec);
    if (ec) {
        LOG_WARN(logging::LogCategory::CONFIG, "Settings file is not valid JSON: %s", ec.message().c_str());
        return false;
    }
    const auto* object = root.if_object();
    if (!object) {
        LOG_WARN(logging::LogCategory::CONFIG, "Settings file root is not an object");
        return false;
    }
    const auto* enabled = object->if_contains(kKeyCustomEnabled);
    const auto* url = object->if_contains(kKeyEndpointUrl);
    if (!enabled || !enabled->is_bool() || !url || !url->is_string()) {
        LOG_WARN(logging::LogCategory::CONFIG, "Settings file lacks %s or %s", kKeyCustomEnabled, kKeyEndpointUrl);
        return false;
    }
    out.customEndpointEnabled = enabled->get_bool();
    const auto& str = url->get_string();
    out.endpointUrl.assign(str.data(), str.size());
    return true;
}

}  // namespace

SettingsStore::SettingsStore(std::string directory, std::string defaultEndpoint)
    : defaultEndpoint_(std::move(defaultEndpoint)),
      path_(resolveDirectory(directory) / kFileName) {
    settings_.endpointUrl = defaultEndpoint_;
}

fs::path SettingsStore::resolveDirectory(const std::string& overrideDir) {
    fs::path dir = overrideDir.empty() ? userConfigBase() : fs::path(overrideDir);
    if (dir.empty()) {
        LOG_WARN(logging::LogCategory::CONFIG, "No user config directory, using working directory");
        return fs::current_path();
    }
    if (overrideDir.empty()) {
        dir /= kAppDirName;
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG_WARN(logging::LogCategory::CONFIG,
                 "Cannot create %s (%s), using working directory",
                 dir.string().c_str(),
                 ec.message().c_str());
        return fs::current_path(ec);
    }
    return dir;
}

void SettingsStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream input(path_);
    if (input) {
        const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        Settings parsed;
        if (fromJson(text, parsed)) {
            settings_ = std::move(parsed);
            LOG_INFO(logging::LogCategory::CONFIG,
                     "Loaded settings from %s (custom endpoint %s)",
                     path_.string().c_str(),
                     settings_.customEndpointEnabled ? "on" : "off");
            return;
        }
    }
    else {
        LOG_INFO(logging::LogCategory::CONFIG, "No settings file at %s", path_.string().c_str());
    }

    settings_ = Settings{};
    settings_.endpointUrl = defaultEndpoint_;
    saveLocked();
}

Settings SettingsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool SettingsStore::setCustomEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.customEndpointEnabled = enabled;
    LOG_INFO(logging::LogCategory::CONFIG, "Custom endpoint %s", enabled ? "enabled" : "disabled");
    return saveLocked();
}

bool SettingsStore::setEndpointUrl(const std::string& url) {
    const auto normalized = normalizeEndpointUrl(url);
    if (!normalized) {
        LOG_WARN(logging::LogCategory::CONFIG, "Rejected endpoint URL '%s'", url.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.endpointUrl = *normalized;
    LOG_INFO(logging::LogCategory::CONFIG, "Endpoint URL set to %s", normalized->c_str());
    return saveLocked();
}

bool SettingsStore::resetToDefault() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = Settings{};
    settings_.endpointUrl = defaultEndpoint_;
    LOG_INFO(logging::LogCategory::CONFIG, "Settings reset to default endpoint %s", defaultEndpoint_.c_str());
    return saveLocked();
}

std::string SettingsStore::activeEndpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (settings_.customEndpointEnabled) {
        if (auto normalized = normalizeEndpointUrl(settings_.endpointUrl)) {
            return *normalized;
        }
        LOG_WARN(logging::LogCategory::CONFIG,
                 "Stored endpoint '%s' is unusable, falling back to default",
                 settings_.endpointUrl.c_str());
    }
    return defaultEndpoint_;
}

bool SettingsStore::saveLocked() const {
    std::ofstream output(path_, std::ios::trunc);
    if (!output) {
        LOG_ERROR(logging::LogCategory::CONFIG, "Cannot write settings file %s", path_.string().c_str());
        return false;
    }
    output << toPrettyJson(settings_);
    output.flush();
    if (!output) {
        LOG_ERROR(logging::LogCategory::CONFIG, "Failed writing settings file %s", path_.string().c_str());
        return false;
    }
    LOG_DEBUG(logging::LogCategory::CONFIG, "Saved settings to %s", path_.string().c_str());
    return true;
}

}  // namespace config
