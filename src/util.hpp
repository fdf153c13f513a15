#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace shop_harvest {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path + query (e.g. "/list?page=2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Resolve @p href against @p baseUrl.  Absolute URLs are returned as-is,
/// "/path" keeps the base authority, anything else is appended to the
/// base path's directory.
std::string resolveUrl(const std::string& baseUrl, const std::string& href);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string urlEncode(const std::string& text);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Lowercase hex SHA-256 of @p data.
std::string sha256Hex(const std::string& data);

/// Stable record identifier: "<sourceId>_<first 8 hex of sha256(link)>".
std::string makeNaturalKey(const std::string& sourceId, const std::string& link);

/// "<sourceId>_<8 random hex chars>".
std::string generateRunId(const std::string& sourceId);

/// Cache key for an address: full-width spaces become ASCII spaces, runs of
/// whitespace collapse to one, ends are trimmed, ASCII letters lowercased.
std::string normalizeAddress(const std::string& address);

/// Replace every "{page}" in @p urlTemplate with @p page.
std::string expandPageTemplate(const std::string& urlTemplate, int page);

std::string trim(const std::string& text);

/// Split on ',' and trim each element; empty elements are dropped.
std::vector<std::string> splitCommaList(const std::string& text);

/// UTC, "2026-01-31T09:15:00Z".
std::string formatIsoTime(TimePoint tp);

/// Inverse of formatIsoTime.  Throws std::invalid_argument.
TimePoint parseIsoTime(const std::string& text);

} // namespace shop_harvest
