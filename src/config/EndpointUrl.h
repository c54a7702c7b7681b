#pragma once

#include <optional>
#include <string>

namespace config {

// Turns user input into a block-explorer API base: trims, defaults the
// scheme to https, drops trailing slashes and makes the path end in "/api".
// Returns nullopt when no usable http(s) URL remains.
std::optional<std::string> normalizeEndpointUrl(const std::string& input);

}  // namespace config
