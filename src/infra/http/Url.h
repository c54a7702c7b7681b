#pragma once

#include <optional>
#include <string>

namespace infra::http {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};

    bool secure() const noexcept { return scheme == "https"; }
    bool defaultPort() const noexcept;
    std::string authority() const;
    std::string toString() const;
};

// Accepts absolute http/https URLs only. Returns nullopt for anything else,
// including an empty host or a non-numeric port.
std::optional<Url> parseUrl(const std::string& text);

// Resolves a redirect Location header against the URL that produced it.
std::optional<Url> resolveLocation(const Url& base, const std::string& location);

}  // namespace infra::http
