#include "config/EndpointUrl.h"

#include "infra/http/Url.h"

#include <cctype>

namespace config {

namespace {

constexpr const char* kApiSuffix = "/api";

std::string trim(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

void stripTrailingSlashes(std::string& s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::optional<std::string> normalizeEndpointUrl(const std::string& input) {
    std::string text = trim(input);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.find("://") == std::string::npos) {
        text = "https://" + text;
    }

    auto url = infra::http::parseUrl(text);
    if (!url) {
        return std::nullopt;
    }

    // A base URL carries no query; keep only the path.
    std::string path = url->target;
    if (const auto query = path.find('?'); query != std::string::npos) {
        path.erase(query);
    }
    stripTrailingSlashes(path);
    if (!endsWith(path, kApiSuffix)) {
        path += kApiSuffix;
    }

    return url->scheme + "://" + url->authority() + path;
}

}  // namespace config
