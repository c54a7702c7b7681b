#pragma once

#include <string>

#include "infra/http/Url.h"

namespace infra::http {

struct HttpResponse {
    unsigned status{0};
    std::string body;

    bool success() const noexcept { return status >= 200U && status < 300U; }
};

// Blocking GET over plain TCP or TLS. Every connect, handshake, write and
// read is bounded by the timeout so a stalled server cannot pin a worker.
class HttpClient {
public:
    explicit HttpClient(int timeoutSec = 10);

    // Throws std::runtime_error on malformed URLs and on DNS, connect, TLS,
    // I/O or timeout failures. Any HTTP status is returned to the caller.
    HttpResponse get(const std::string& url) const;

    int timeoutSec() const noexcept { return timeoutSec_; }

private:
    int timeoutSec_;
};

}  // namespace infra::http
