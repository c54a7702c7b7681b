#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "config/Config.h"

namespace config {

// User-editable settings persisted as config.json.
struct Settings {
    bool customEndpointEnabled{false};
    std::string endpointUrl{kDefaultNetworkApiUrl};
};

class SettingsStore {
public:
    // Empty directory selects <user config dir>/btcticker.
    explicit SettingsStore(std::string directory = {}, std::string defaultEndpoint = kDefaultNetworkApiUrl);

    // Missing or unreadable file: defaults are written back immediately.
    void load();

    Settings snapshot() const;
    const std::filesystem::path& path() const { return path_; }
    const std::string& defaultEndpoint() const { return defaultEndpoint_; }

    // Each setter saves synchronously. Returns false when the file could not
    // be written; the in-memory value is updated either way.
    bool setCustomEnabled(bool enabled);
    // Stores the normalized form; false when the input is not a usable URL.
    bool setEndpointUrl(const std::string& url);
    bool resetToDefault();

    // Custom URL when enabled, otherwise the default endpoint.
    std::string activeEndpoint() const;

    static std::filesystem::path resolveDirectory(const std::string& overrideDir);

private:
    bool saveLocked() const;

    mutable std::mutex mutex_;
    std::string defaultEndpoint_;
    std::filesystem::path path_;
    Settings settings_;
};

}  // namespace config
