#include "geocoder.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <utility>

namespace shop_harvest {

namespace {

constexpr const char* kTag = "Geocoding";

} // namespace

// ---------------------------------------------------------------------------
// GoogleMapsGeocoder
// ---------------------------------------------------------------------------

GoogleMapsGeocoder::GoogleMapsGeocoder(HttpClient& http, Options options)
    : mHttp(http)
    , mOptions(std::move(options))
{
    if (mOptions.apiKey.empty()) {
        throw ConfigError("Google Maps geocoder requires an API key");
    }
}

std::string GoogleMapsGeocoder::requestUrl(const std::string& address) const {
    std::string url = mOptions.endpoint;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "address=" + urlEncode(address);
    if (!mOptions.region.empty()) {
        url += "&region=" + urlEncode(mOptions.region);
    }
    url += "&key=" + urlEncode(mOptions.apiKey);
    return url;
}

std::optional<GeoLocation> GoogleMapsGeocoder::geocode(const std::string& address) {
    if (trim(address).empty()) {
        SH_LOG_WARN(kTag, "Empty address provided for geocoding");
        return std::nullopt;
    }

    nlohmann::json body;
    try {
        body = mHttp.getJson(requestUrl(address));
    } catch (const TransportError& e) {
        throw EnrichmentError(std::string("Geocoding transport error: ") + e.what());
    } catch (const ExtractionError& e) {
        throw EnrichmentError(std::string("Geocoding response unreadable: ") + e.what());
    }

    auto location = parseGeocodeResponse(body);
    if (location) {
        SH_LOG_DEBUG(kTag, "Geocoded " << address << " -> (" << location->latitude
                     << ", " << location->longitude << ")");
    } else {
        SH_LOG_WARN(kTag, "No geocoding results for address: " << address);
    }
    return location;
}

std::optional<GeoLocation> parseGeocodeResponse(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw EnrichmentError("Geocoding response is not an object");
    }

    const std::string status = body.value("status", "");
    if (status == "ZERO_RESULTS") {
        return std::nullopt;
    }
    if (status == "OVER_QUERY_LIMIT" || status == "OVER_DAILY_LIMIT" ||
        status == "REQUEST_DENIED") {
        throw EnrichmentError("Geocoding API refused request: " + status + " " +
                              body.value("error_message", ""), /*fatal=*/true);
    }
    if (status != "OK") {
        throw EnrichmentError("Geocoding API error: " +
                              (status.empty() ? std::string("missing status") : status));
    }

    const auto results = body.find("results");
    if (results == body.end() || !results->is_array() || results->empty()) {
        return std::nullopt;
    }

    const auto& first = results->front();
    const nlohmann::json* loc = nullptr;
    if (first.contains("geometry") && first["geometry"].contains("location")) {
        loc = &first["geometry"]["location"];
    }
    if (loc == nullptr || !loc->contains("lat") || !loc->contains("lng") ||
        !(*loc)["lat"].is_number() || !(*loc)["lng"].is_number()) {
        SH_LOG_WARN(kTag, "Geocoding result without lat/lng");
        return std::nullopt;
    }

    GeoLocation location;
    location.latitude  = (*loc)["lat"].get<double>();
    location.longitude = (*loc)["lng"].get<double>();
    if (first.contains("formatted_address") && first["formatted_address"].is_string()) {
        location.formattedAddress = first["formatted_address"].get<std::string>();
    }
    if (first.contains("place_id") && first["place_id"].is_string()) {
        location.placeId = first["place_id"].get<std::string>();
    }
    return location;
}

// ---------------------------------------------------------------------------
// GeocodingCache
// ---------------------------------------------------------------------------

GeocodingCache::GeocodingCache(Geocoder& inner)
    : mInner(inner) {}

std::optional<GeoLocation> GeocodingCache::geocode(const std::string& address) {
    const auto key = normalizeAddress(address);
    if (key.empty()) {
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mEntries.find(key);
        if (it != mEntries.end()) {
            ++mStats.hits;
            return it->second;
        }
        ++mStats.misses;
    }

    auto result = mInner.geocode(address);

    std::lock_guard<std::mutex> lock(mMutex);
    mEntries[key] = result;
    return result;
}

void GeocodingCache::prefetch(const std::vector<std::string>& addresses) {
    int loaded = 0;
    for (const auto& address : addresses) {
        try {
            geocode(address);
            ++loaded;
        } catch (const EnrichmentError& e) {
            if (e.fatal()) {
                throw;
            }
            SH_LOG_WARN(kTag, "Prefetch failed for " << address << ": " << e.what());
        }
    }
    SH_LOG_INFO(kTag, "Prefetched " << loaded << "/" << addresses.size() << " addresses");
}

void GeocodingCache::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mEntries.clear();
    mStats = Stats{};
}

GeocodingCache::Stats GeocodingCache::stats() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mStats;
}

double GeocodingCache::hitRate() const {
    std::lock_guard<std::mutex> lock(mMutex);
    const int lookups = mStats.hits + mStats.misses;
    return lookups == 0 ? 0.0 : static_cast<double>(mStats.hits) / lookups;
}

std::size_t GeocodingCache::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries.size();
}

// ---------------------------------------------------------------------------
// PacedGeocoder
// ---------------------------------------------------------------------------

PacedGeocoder::PacedGeocoder(Geocoder& inner, RateLimiter limiter)
    : mInner(inner)
    , mLimiter(std::move(limiter)) {}

std::optional<GeoLocation> PacedGeocoder::geocode(const std::string& address) {
    std::lock_guard<std::mutex> lock(mMutex);
    mLimiter.wait();
    return mInner.geocode(address);
}

// ---------------------------------------------------------------------------
// GeocodingService
// ---------------------------------------------------------------------------

GeocodingService::GeocodingService(Geocoder& geocoder, RateLimiter limiter, bool useCache)
    : mPaced(geocoder, std::move(limiter))
{
    if (useCache) {
        mCache = std::make_unique<GeocodingCache>(mPaced);
    }
    SH_LOG_INFO(kTag, "GeocodingService initialized: cache=" << (useCache ? "on" : "off"));
}

Geocoder& GeocodingService::front() {
    if (mCache) {
        return *mCache;
    }
    return mPaced;
}

bool GeocodingService::geocodeRecord(CrawlRecord& record, const std::string& addressPrefix) {
    if (trim(record.address).empty()) {
        SH_LOG_DEBUG(kTag, "Record " << record.naturalKey << " has no address");
        return false;
    }

    const std::string fullAddress = addressPrefix + record.address;
    std::optional<GeoLocation> location;
    try {
        location = front().geocode(fullAddress);
    } catch (const EnrichmentError& e) {
        if (e.fatal()) {
            throw;
        }
        SH_LOG_ERROR(kTag, "Geocoding error for " << record.naturalKey << ": " << e.what());
        return false;
    }

    if (!location) {
        SH_LOG_WARN(kTag, "Failed to geocode " << record.naturalKey << ": " << fullAddress);
        return false;
    }

    record.latitude   = location->latitude;
    record.longitude  = location->longitude;
    record.geocodedAt = Clock::now();
    return true;
}

GeocodeBatchResult GeocodingService::geocodeBatch(Batch& records,
                                                  const std::string& addressPrefix) {
    GeocodeBatchResult result;
    result.total = static_cast<int>(records.size());

    for (auto& record : records) {
        if (record.hasCoordinates()) {
            ++result.skipped;
            continue;
        }
        try {
            if (geocodeRecord(record, addressPrefix)) {
                ++result.success;
            } else {
                ++result.failure;
            }
        } catch (const EnrichmentError& e) {
            result.fatalError = e.what();
            SH_LOG_ERROR(kTag, "Batch geocoding stopped after " << result.success
                         << " success: " << e.what());
            return result;
        }
    }

    SH_LOG_INFO(kTag, "Batch geocoding completed: " << result.success << " success, "
                << result.failure << " failure, " << result.skipped << " skipped");
    return result;
}

std::optional<GeocodingCache::Stats> GeocodingService::cacheStats() const {
    if (!mCache) {
        return std::nullopt;
    }
    return mCache->stats();
}

} // namespace shop_harvest
