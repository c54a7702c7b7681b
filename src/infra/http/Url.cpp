#include "infra/http/Url.h"

#include <algorithm>
#include <cctype>

namespace infra::http {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool allDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

const char* defaultPortFor(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

}  // namespace

bool Url::defaultPort() const noexcept {
    return port == defaultPortFor(scheme);
}

std::string Url::authority() const {
    const std::string hostPart = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (defaultPort()) {
        return hostPart;
    }
    return hostPart + ":" + port;
}

std::string Url::toString() const {
    return scheme + "://" + authority() + (target.empty() ? std::string{"/"} : target);
}

std::optional<Url> parseUrl(const std::string& text) {
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = lowercase(text.substr(0, schemeEnd));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    const std::string rest = text.substr(schemeEnd + 3);
    const auto pathStart = rest.find_first_of("/?#");
    std::string hostPort = pathStart == std::string::npos ? rest : rest.substr(0, pathStart);
    if (hostPort.find('@') != std::string::npos) {
        return std::nullopt;
    }

    std::string portPart;
    if (!hostPort.empty() && hostPort.front() == '[') {
        const auto close = hostPort.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') {
                return std::nullopt;
            }
            portPart = hostPort.substr(close + 2);
        }
    }
    else {
        const auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            url.host = hostPort.substr(0, colon);
            portPart = hostPort.substr(colon + 1);
        }
        else {
            url.host = hostPort;
        }
    }

    url.host = lowercase(url.host);
    if (url.host.empty()) {
        return std::nullopt;
    }
    for (unsigned char c : url.host) {
        if (std::isspace(c) != 0) {
            return std::nullopt;
        }
    }

    if (portPart.empty()) {
        url.port = defaultPortFor(url.scheme);
    }
    else if (allDigits(portPart) && portPart.size() <= 5 && std::stoi(portPart) > 0 && std::stoi(portPart) <= 65535) {
        url.port = portPart;
    }
    else {
        return std::nullopt;
    }

    if (pathStart == std::string::npos) {
        url.target = "/";
    }
    else {
        std::string target = rest.substr(pathStart);
        const auto fragment = target.find('#');
        if (fragment != std::string::npos) {
            target.erase(fragment);
        }
        if (target.empty() || target.front() != '/') {
            target.insert(target.begin(), '/');
        }
        url.target = target;
    }
    return url;
}

std::optional<Url> resolveLocation(const Url& base, const std::string& location) {
    if (location.empty()) {
        return std::nullopt;
    }
    if (location.find("://") != std::string::npos) {
        return parseUrl(location);
    }
    if (location.rfind("//", 0) == 0) {
        return parseUrl(base.scheme + ":" + location);
    }

    Url resolved = base;
    if (location.front() == '/') {
        resolved.target = location;
    }
    else {
        std::string dir = base.target;
        const auto query = dir.find('?');
        if (query != std::string::npos) {
            dir.erase(query);
        }
        const auto slash = dir.rfind('/');
        dir = slash == std::string::npos ? std::string{"/"} : dir.substr(0, slash + 1);
        resolved.target = dir + location;
    }
    return resolved;
}

}  // namespace infra::http
