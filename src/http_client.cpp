#include "http_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <stdexcept>
#include <thread>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace shop_harvest {

namespace {

constexpr const char* kTag = "HttpClient";

using Request     = http::request<http::string_body>;
using RawResponse = http::response<http::string_body>;

Request buildRequest(const std::string& method,
                     const UrlParts& parts,
                     const std::string& body,
                     const HttpClient::Headers& headers,
                     const std::string& userAgent)
{
    const auto verb = (method == "POST") ? http::verb::post : http::verb::get;

    Request req{verb, parts.target, 11};
    req.set(http::field::host, parts.host);
    req.set(http::field::user_agent, userAgent);
    req.set(http::field::accept, "*/*");
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    if (verb == http::verb::post) {
        if (req[http::field::content_type].empty()) {
            req.set(http::field::content_type, "application/json");
        }
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

RawResponse doHttpRequest(const UrlParts& parts, const Request& req, int timeoutMs) {
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve(parts.host, parts.port);
    stream.expires_after(std::chrono::milliseconds(timeoutMs));
    stream.connect(results);

    stream.expires_after(std::chrono::milliseconds(timeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    RawResponse res;
    stream.expires_after(std::chrono::milliseconds(timeoutMs));
    http::read(stream, buffer, res);

    // Graceful shutdown (non-critical errors are ignored).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

// ---------------------------------------------------------------------------
// HTTPS
// ---------------------------------------------------------------------------

RawResponse doHttpsRequest(const UrlParts& parts, const Request& req, int timeoutMs) {
    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        throw TransportError("Failed to set SNI hostname for " + parts.host);
    }

    auto const results = resolver.resolve(parts.host, parts.port);
    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    RawResponse res;
    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);
    return res;
}

bool isRedirect(unsigned int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient()
    : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options)
    : mOptions(std::move(options))
{
    if (mOptions.maxAttempts < 1) {
        mOptions.maxAttempts = 1;
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::get(const std::string& url, const Headers& headers) {
    return executeWithRetry("GET", url, "", headers);
}

nlohmann::json HttpClient::getJson(const std::string& url, const Headers& headers) {
    const auto resp = get(url, headers);
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ExtractionError("Failed to parse JSON from " + url + ": " + e.what());
    }
}

HttpClient::Response HttpClient::postJson(const std::string& url,
                                          const nlohmann::json& body,
                                          const Headers& headers) {
    return executeWithRetry("POST", url,
                            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            headers);
}

bool HttpClient::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::executeWithRetry(const std::string& method,
                                                  const std::string& url,
                                                  const std::string& body,
                                                  const Headers& headers)
{
    std::string lastError;

    for (int attempt = 0; attempt < mOptions.maxAttempts; ++attempt) {
        const bool lastAttempt = (attempt == mOptions.maxAttempts - 1);
        Response resp;

        try {
            resp = send(method, url, body, headers);
        } catch (const TransportError& e) {
            if (e.httpStatus() != 0) {
                throw;   // redirect loop, not transient
            }
            lastError = e.what();
            SH_LOG_WARN(kTag, "Network error on " << method << " " << url << ": " << lastError
                        << " (attempt " << (attempt + 1) << "/" << mOptions.maxAttempts << ")");
            if (lastAttempt) break;

            ++mStats.totalRetries;
            std::this_thread::sleep_for(
                computeBackoffMs(attempt, mOptions.backoffBaseMs, mOptions.backoffMaxMs));
            continue;
        }

        if (isRetryableStatus(resp.httpStatus)) {
            lastError = "HTTP " + std::to_string(resp.httpStatus);
            SH_LOG_WARN(kTag, method << " " << url << " returned " << resp.httpStatus
                        << " (attempt " << (attempt + 1) << "/" << mOptions.maxAttempts << ")");
            if (lastAttempt) {
                throw TransportError("Max retries exceeded for " + url + ". Last status: " +
                                     std::to_string(resp.httpStatus), resp.httpStatus);
            }

            ++mStats.totalRetries;
            std::this_thread::sleep_for(
                computeBackoffMs(attempt, mOptions.backoffBaseMs, mOptions.backoffMaxMs));
            continue;
        }

        if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
            throw TransportError("HTTP " + std::to_string(resp.httpStatus) + " from " + url,
                                 resp.httpStatus);
        }
        return resp;
    }

    throw TransportError("Max retries exceeded for " + url + ". Last error: " + lastError);
}

HttpClient::Response HttpClient::send(const std::string& method,
                                      std::string url,
                                      const std::string& body,
                                      const Headers& headers)
{
    std::string currentMethod = method;

    for (int hop = 0; hop <= mOptions.maxRedirects; ++hop) {
        UrlParts parts;
        try {
            parts = parseUrl(url);
        } catch (const std::invalid_argument& e) {
            throw TransportError(e.what(), 400);
        }

        const auto req = buildRequest(currentMethod, parts, body, headers, mOptions.userAgent);

        SH_LOG_DEBUG(kTag, currentMethod << " " << url);
        ++mStats.totalRequests;

        RawResponse res;
        try {
            res = (parts.scheme == "https") ? doHttpsRequest(parts, req, mOptions.timeoutMs)
                                            : doHttpRequest(parts, req, mOptions.timeoutMs);
        } catch (const TransportError&) {
            throw;
        } catch (const std::exception& e) {
            throw TransportError(std::string("Request to ") + url + " failed: " + e.what());
        }

        const unsigned int status = res.result_int();
        SH_LOG_DEBUG(kTag, "HTTP " << status << " from " << url);

        if (isRedirect(status)) {
            auto location = res[http::field::location];
            if (location.empty()) {
                throw TransportError("Redirect without Location from " + url, status);
            }
            url = resolveUrl(url, std::string(location.data(), location.size()));
            if (status == 303) {
                currentMethod = "GET";
            }
            continue;
        }

        Response response;
        response.httpStatus = status;
        response.body       = std::move(res.body());
        return response;
    }

    throw TransportError("Too many redirects starting at " + url, 310);
}

} // namespace shop_harvest
