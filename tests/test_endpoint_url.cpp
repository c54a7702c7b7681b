#include <iostream>
#include <optional>
#include <string>

#include "config/EndpointUrl.h"

namespace {

bool expectNormalized(const std::string& input, const std::string& expected) {
    const auto actual = config::normalizeEndpointUrl(input);
    if (!actual || *actual != expected) {
        std::cerr << "normalize('" << input << "') = '" << (actual ? *actual : std::string("<none>"))
                  << "', expected '" << expected << "'\n";
        return false;
    }
    return true;
}

bool expectRejected(const std::string& input) {
    const auto actual = config::normalizeEndpointUrl(input);
    if (actual) {
        std::cerr << "normalize('" << input << "') should fail, got '" << *actual << "'\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!expectNormalized("example.com/", "https://example.com/api")) {
        return 1;
    }
    if (!expectNormalized("http://node.local:3006/api/", "http://node.local:3006/api")) {
        return 1;
    }
    if (!expectNormalized("  https://mempool.space/api  ", "https://mempool.space/api")) {
        return 1;
    }
    if (!expectNormalized("https://mempool.space", "https://mempool.space/api")) {
        return 1;
    }
    if (!expectNormalized("https://host.example/mempool///", "https://host.example/mempool/api")) {
        return 1;
    }
    if (!expectNormalized("192.168.1.10:8999", "https://192.168.1.10:8999/api")) {
        return 1;
    }
    if (!expectNormalized("https://example.com:443/api", "https://example.com/api")) {
        return 1;
    }

    if (!expectRejected("")) {
        return 1;
    }
    if (!expectRejected("   ")) {
        return 1;
    }
    if (!expectRejected("ftp://example.com/api")) {
        return 1;
    }
    if (!expectRejected("https:///api")) {
        return 1;
    }

    // Normalizing twice changes nothing.
    const auto once = config::normalizeEndpointUrl("Example.com/api/");
    const auto twice = once ? config::normalizeEndpointUrl(*once) : std::nullopt;
    if (!once || !twice || *once != *twice) {
        std::cerr << "normalization is not idempotent\n";
        return 1;
    }

    return 0;
}
