#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace shop_harvest {

/// Synchronous HTTP/HTTPS client built on Boost.Beast.
///
/// Transient failures (network errors, timeouts, 429, 5xx) are retried with
/// exponential backoff; redirects are followed.  Anything that still fails is
/// reported as TransportError.
class HttpClient {
public:
    using Headers = std::map<std::string, std::string>;

    struct Options {
        int         timeoutMs   = 20000;   // per connect / read
        int         maxAttempts = 3;
        int         maxRedirects = 5;
        int64_t     backoffBaseMs = 200;
        int64_t     backoffMaxMs  = 5000;
        std::string userAgent   = "shop_harvest/1.0";
    };

    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    struct Stats {
        int totalRequests = 0;
        int totalRetries  = 0;
    };

    HttpClient();
    explicit HttpClient(Options options);

    /// GET @p url.  @throws TransportError unless the final status is 2xx.
    Response get(const std::string& url, const Headers& headers = {});

    /// GET and parse the body as JSON.
    /// @throws TransportError, or ExtractionError if the body is not JSON.
    nlohmann::json getJson(const std::string& url, const Headers& headers = {});

    /// POST a JSON document.  @throws TransportError unless 2xx.
    Response postJson(const std::string& url, const nlohmann::json& body,
                      const Headers& headers = {});

    Stats          stats()   const { return mStats; }
    const Options& options() const { return mOptions; }

    static bool isRetryableStatus(unsigned int status);

private:
    Options mOptions;
    Stats   mStats{};

    Response executeWithRetry(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              const Headers& headers);

    /// One request, following redirects.  Network errors throw TransportError.
    Response send(const std::string& method,
                  std::string url,
                  const std::string& body,
                  const Headers& headers);
};

} // namespace shop_harvest
