#include "infra/http/HttpClient.h"

#include "logging/Log.h"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "btcticker/0.1";

using Response = bhttp::response<bhttp::string_body>;

std::runtime_error makeError(const Url& url, const std::string& message) {
    std::ostringstream oss;
    oss << "GET " << url.toString() << " failed: " << message;
    return std::runtime_error(oss.str());
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

template <class Stream>
Response exchange(Stream& stream, beast::tcp_stream& lowest, const Url& url, int timeoutSec) {
    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, url.target, 11};
    req.set(bhttp::field::host, url.authority());
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json, text/plain");
    req.set(bhttp::field::connection, "close");

    beast::error_code ec;
    lowest.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(url, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    Response response;
    lowest.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(url, "Read error: " + ec.message());
    }
    return response;
}

Response performPlain(net::io_context& ioc,
                      const net::ip::tcp::resolver::results_type& endpoints,
                      const Url& url,
                      int timeoutSec) {
    beast::tcp_stream stream(ioc);
    beast::error_code ec;
    stream.expires_after(std::chrono::seconds(timeoutSec));
    stream.connect(endpoints, ec);
    if (ec) {
        throw makeError(url, "Connection error: " + ec.message());
    }

    Response response = exchange(stream, stream, url, timeoutSec);

    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        LOG_DEBUG(logging::LogCategory::NET, "TCP shutdown warning: %s", ec.message().c_str());
    }
    return response;
}

Response performTls(net::io_context& ioc,
                    const net::ip::tcp::resolver::results_type& endpoints,
                    const Url& url,
                    int timeoutSec) {
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << url.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(url, oss.str());
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    beast::error_code ec;
    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(std::chrono::seconds(timeoutSec));
    lowest.connect(endpoints, ec);
    if (ec) {
        throw makeError(url, "Connection error: " + ec.message());
    }

    lowest.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(url, "TLS handshake error: " + ec.message());
    }

    Response response = exchange(stream, lowest, url, timeoutSec);

    lowest.expires_after(std::chrono::seconds(timeoutSec));
    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
        ec = {};
    }
    if (ec) {
        LOG_DEBUG(logging::LogCategory::NET, "TLS shutdown warning: %s", ec.message().c_str());
    }
    return response;
}

Response performRequest(const Url& url, int timeoutSec) {
    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto const endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw makeError(url, "DNS resolution error: " + ec.message());
    }

    if (url.secure()) {
        return performTls(ioc, endpoints, url, timeoutSec);
    }
    return performPlain(ioc, endpoints, url, timeoutSec);
}

}  // namespace

HttpClient::HttpClient(int timeoutSec)
    : timeoutSec_(timeoutSec > 0 ? timeoutSec : 10) {}

HttpResponse HttpClient::get(const std::string& url) const {
    auto parsed = parseUrl(url);
    if (!parsed) {
        throw std::runtime_error("GET " + url + " failed: malformed URL");
    }

    Url current = *parsed;
    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        LOG_TRACE(logging::LogCategory::NET, "GET %s", current.toString().c_str());
        Response response = performRequest(current, timeoutSec_);
        const auto status = static_cast<unsigned>(response.result_int());

        if (isRedirect(status)) {
            const auto location = std::string(response.base()[bhttp::field::location]);
            auto next = resolveLocation(current, location);
            if (!next) {
                throw makeError(current, "Redirect with unusable Location '" + location + "'");
            }
            if (current.secure() && !next->secure()) {
                throw makeError(current, "Insecure redirect to HTTP is not supported");
            }
            LOG_DEBUG(logging::LogCategory::NET,
                      "Redirect %u %s -> %s",
                      status,
                      current.toString().c_str(),
                      next->toString().c_str());
            current = *next;
            continue;
        }

        HttpResponse result;
        result.status = status;
        result.body = std::move(response.body());
        return result;
    }

    throw makeError(current, "Too many redirects");
}

}  // namespace infra::http
