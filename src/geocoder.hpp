#pragma once

#include "http_client.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Address to coordinates.
///
/// std::nullopt means "the service answered, nothing matched".  Failures are
/// EnrichmentError; fatal() ones (quota exhausted, key rejected) mean no
/// further request can succeed.
class Geocoder {
public:
    virtual ~Geocoder() = default;

    virtual std::optional<GeoLocation> geocode(const std::string& address) = 0;
};

// ---------------------------------------------------------------------------
// Google Maps Geocoding API
// ---------------------------------------------------------------------------

class GoogleMapsGeocoder : public Geocoder {
public:
    struct Options {
        std::string endpoint = "https://maps.googleapis.com/maps/api/geocode/json";
        std::string apiKey;
        std::string region   = "jp";
    };

    /// @throws ConfigError if no API key is given.
    GoogleMapsGeocoder(HttpClient& http, Options options);

    std::optional<GeoLocation> geocode(const std::string& address) override;

    /// Request URL for @p address (key included).
    std::string requestUrl(const std::string& address) const;

private:
    HttpClient& mHttp;
    Options     mOptions;
};

/// Interpret a Geocoding API response body.
///   OK                          -> first result
///   ZERO_RESULTS                -> std::nullopt
///   OVER_QUERY_LIMIT, OVER_DAILY_LIMIT, REQUEST_DENIED -> fatal EnrichmentError
///   anything else               -> non-fatal EnrichmentError
std::optional<GeoLocation> parseGeocodeResponse(const nlohmann::json& body);

// ---------------------------------------------------------------------------
// Decorators
// ---------------------------------------------------------------------------

/// Memoizes another Geocoder by normalized address.  Negative answers are
/// cached too; errors are not.
class GeocodingCache : public Geocoder {
public:
    struct Stats {
        int hits   = 0;
        int misses = 0;
    };

    explicit GeocodingCache(Geocoder& inner);

    std::optional<GeoLocation> geocode(const std::string& address) override;

    /// Resolve @p addresses ahead of time.  Non-fatal errors are logged and
    /// skipped.  @throws EnrichmentError when fatal.
    void prefetch(const std::vector<std::string>& addresses);

    /// Resets the counters as well.
    void clear();

    Stats       stats()   const;
    double      hitRate() const;   // 0.0 before the first lookup
    std::size_t size()    const;

private:
    Geocoder&          mInner;
    mutable std::mutex mMutex;
    std::map<std::string, std::optional<GeoLocation>> mEntries;
    Stats              mStats{};
};

/// Holds every call to the wrapped Geocoder to the pace of a RateLimiter.
/// Calls are serialized, so one instance may be shared between sources.
class PacedGeocoder : public Geocoder {
public:
    PacedGeocoder(Geocoder& inner, RateLimiter limiter);

    std::optional<GeoLocation> geocode(const std::string& address) override;

private:
    Geocoder&   mInner;
    RateLimiter mLimiter;
    std::mutex  mMutex;
};

// ---------------------------------------------------------------------------
// Batch enrichment
// ---------------------------------------------------------------------------

struct GeocodeBatchResult {
    int success = 0;
    int failure = 0;
    int skipped = 0;   // already had coordinates
    int total   = 0;

    std::string fatalError;   // set when a fatal geocoder error stopped the batch early
};

/// Fills in coordinates for a batch of records.
///
/// The lookup chain is [cache ->] pacer -> geocoder, so cache hits are never
/// rate limited.
class GeocodingService {
public:
    GeocodingService(Geocoder& geocoder, RateLimiter limiter, bool useCache = true);

    /// Records that already carry coordinates are skipped; records without an
    /// address count as failures.  The looked-up address is
    /// @p addressPrefix + address.  A fatal geocoder error stops the batch;
    /// the counts cover the records handled before it and fatalError says why.
    GeocodeBatchResult geocodeBatch(Batch& records, const std::string& addressPrefix = {});

    /// True when coordinates were set.
    bool geocodeRecord(CrawlRecord& record, const std::string& addressPrefix = {});

    /// Present only when caching is enabled.
    std::optional<GeocodingCache::Stats> cacheStats() const;

    GeocodingCache* cache() { return mCache.get(); }

private:
    PacedGeocoder                   mPaced;
    std::unique_ptr<GeocodingCache> mCache;

    Geocoder& front();
};

} // namespace shop_harvest
