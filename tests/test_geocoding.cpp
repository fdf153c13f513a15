/// @file test_geocoding.cpp
/// Unit tests for geocoder.hpp: response parsing, the address cache and
/// batch enrichment.

#include "errors.hpp"
#include "fakes.hpp"
#include "geocoder.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace shop_harvest;
using namespace shop_harvest::testing_fakes;
using json = nlohmann::json;

namespace {

GeoLocation at(double lat, double lng) {
    GeoLocation loc;
    loc.latitude  = lat;
    loc.longitude = lng;
    return loc;
}

CrawlRecord withAddress(const std::string& key, const std::string& address) {
    CrawlRecord r;
    r.naturalKey = key;
    r.sourceId   = "08";
    r.name       = key;
    r.address    = address;
    return r;
}

bool isFatalError(const json& body) {
    try {
        parseGeocodeResponse(body);
    } catch (const EnrichmentError& e) {
        return e.fatal();
    }
    ADD_FAILURE() << "expected EnrichmentError";
    return false;
}

} // namespace

// ============================================================================
// parseGeocodeResponse
// ============================================================================

TEST(ParseGeocodeResponse, OkTakesFirstResult) {
    const json body = {
        {"status", "OK"},
        {"results", {
            {{"geometry", {{"location", {{"lat", 36.3418}, {"lng", 140.4468}}}}},
             {"formatted_address", "Mito, Ibaraki, Japan"},
             {"place_id", "ChIJ-mito"}},
            {{"geometry", {{"location", {{"lat", 0.0}, {"lng", 0.0}}}}}},
        }},
    };

    const auto loc = parseGeocodeResponse(body);
    ASSERT_TRUE(loc.has_value());
    EXPECT_DOUBLE_EQ(loc->latitude, 36.3418);
    EXPECT_DOUBLE_EQ(loc->longitude, 140.4468);
    EXPECT_EQ(loc->formattedAddress, std::optional<std::string>("Mito, Ibaraki, Japan"));
    EXPECT_EQ(loc->placeId, std::optional<std::string>("ChIJ-mito"));
}

TEST(ParseGeocodeResponse, ZeroResultsIsNoMatch) {
    EXPECT_FALSE(parseGeocodeResponse(json{{"status", "ZERO_RESULTS"}, {"results", json::array()}})
                     .has_value());
}

TEST(ParseGeocodeResponse, OkWithoutResultsIsNoMatch) {
    EXPECT_FALSE(parseGeocodeResponse(json{{"status", "OK"}, {"results", json::array()}})
                     .has_value());
}

TEST(ParseGeocodeResponse, QuotaAndDeniedAreFatal) {
    EXPECT_TRUE(isFatalError(json{{"status", "OVER_QUERY_LIMIT"}}));
    EXPECT_TRUE(isFatalError(json{{"status", "OVER_DAILY_LIMIT"}}));
    EXPECT_TRUE(isFatalError(json{{"status", "REQUEST_DENIED"}, {"error_message", "bad key"}}));
}

TEST(ParseGeocodeResponse, OtherErrorsAreNotFatal) {
    EXPECT_FALSE(isFatalError(json{{"status", "INVALID_REQUEST"}}));
    EXPECT_FALSE(isFatalError(json{{"status", "UNKNOWN_ERROR"}}));
    EXPECT_FALSE(isFatalError(json::object()));
}

TEST(ParseGeocodeResponse, NonObjectThrows) {
    EXPECT_THROW(parseGeocodeResponse(json::array()), EnrichmentError);
}

// ============================================================================
// GoogleMapsGeocoder
// ============================================================================

TEST(GoogleMapsGeocoder, RequestUrlEncodesAddressAndKey) {
    HttpClient http;
    GoogleMapsGeocoder::Options opts;
    opts.endpoint = "https://maps.example.test/geocode/json";
    opts.apiKey   = "k&y";
    GoogleMapsGeocoder geocoder(http, opts);

    EXPECT_EQ(geocoder.requestUrl("1-2 Mito shi"),
              "https://maps.example.test/geocode/json?address=1-2%20Mito%20shi&region=jp&key=k%26y");
}

TEST(GoogleMapsGeocoder, MissingKeyIsConfigError) {
    HttpClient http;
    EXPECT_THROW(GoogleMapsGeocoder(http, GoogleMapsGeocoder::Options{}), ConfigError);
}

TEST(GoogleMapsGeocoder, BlankAddressNeedsNoRequest) {
    HttpClient http;
    GoogleMapsGeocoder::Options opts;
    opts.apiKey = "key";
    GoogleMapsGeocoder geocoder(http, opts);

    EXPECT_FALSE(geocoder.geocode("   ").has_value());
    EXPECT_EQ(http.stats().totalRequests, 0);
}

// ============================================================================
// GeocodingCache
// ============================================================================

TEST(GeocodingCache, SecondLookupIsAHit) {
    FakeGeocoder inner;
    inner.known["Mito 1"] = at(36.3, 140.4);
    GeocodingCache cache(inner);

    ASSERT_TRUE(cache.geocode("Mito 1").has_value());
    ASSERT_TRUE(cache.geocode("Mito 1").has_value());

    EXPECT_EQ(inner.totalCalls, 1);
    EXPECT_EQ(cache.stats().hits, 1);
    EXPECT_EQ(cache.stats().misses, 1);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.5);
}

TEST(GeocodingCache, NormalizedAddressesShareAnEntry) {
    FakeGeocoder inner;
    inner.known["Mito  1"] = at(36.3, 140.4);
    GeocodingCache cache(inner);

    cache.geocode("Mito  1");
    const auto hit = cache.geocode("  mito\xE3\x80\x80" "1 ");   // U+3000 between words
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(inner.totalCalls, 1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(GeocodingCache, NoMatchIsCached) {
    FakeGeocoder inner;
    GeocodingCache cache(inner);

    EXPECT_FALSE(cache.geocode("Nowhere").has_value());
    EXPECT_FALSE(cache.geocode("Nowhere").has_value());
    EXPECT_EQ(inner.totalCalls, 1);
}

TEST(GeocodingCache, ErrorsAreNotCached) {
    FakeGeocoder inner;
    inner.erroring.insert("Flaky");
    GeocodingCache cache(inner);

    EXPECT_THROW(cache.geocode("Flaky"), EnrichmentError);
    EXPECT_THROW(cache.geocode("Flaky"), EnrichmentError);
    EXPECT_EQ(inner.totalCalls, 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(GeocodingCache, ClearResetsEntriesAndStats) {
    FakeGeocoder inner;
    GeocodingCache cache(inner);
    cache.geocode("a");
    cache.geocode("a");
    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().hits, 0);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.0);
}

TEST(GeocodingCache, PrefetchSkipsNonFatalAndStopsOnFatal) {
    FakeGeocoder inner;
    inner.known["a"] = at(1, 1);
    inner.erroring.insert("b");
    GeocodingCache cache(inner);

    EXPECT_NO_THROW(cache.prefetch({"a", "b", "c"}));
    EXPECT_EQ(cache.size(), 2u);   // "a" and the negative "c"

    inner.quotaExhausted = true;
    EXPECT_THROW(cache.prefetch({"d"}), EnrichmentError);
}

// ============================================================================
// GeocodingService
// ============================================================================

TEST(GeocodingService, BatchCountsSuccessFailureAndSkip) {
    FakeGeocoder inner;
    inner.known["Ibaraki Mito 1"] = at(36.3, 140.4);
    GeocodingService service(inner, RateLimiter(0.0, 0.0));

    auto already = withAddress("08_3", "Mito 3");
    already.latitude  = 1.0;
    already.longitude = 2.0;

    Batch batch = {withAddress("08_1", "Mito 1"), withAddress("08_2", "Mito 2"),
                   already, withAddress("08_4", "")};

    const auto result = service.geocodeBatch(batch, "Ibaraki ");
    EXPECT_EQ(result.total, 4);
    EXPECT_EQ(result.success, 1);
    EXPECT_EQ(result.failure, 2);   // no match, no address
    EXPECT_EQ(result.skipped, 1);

    ASSERT_TRUE(batch[0].hasCoordinates());
    EXPECT_DOUBLE_EQ(*batch[0].latitude, 36.3);
    EXPECT_TRUE(batch[0].geocodedAt.has_value());
    EXPECT_FALSE(batch[1].hasCoordinates());
    EXPECT_DOUBLE_EQ(*batch[2].latitude, 1.0);

    EXPECT_EQ(inner.calls.count("Mito 3"), 0u);
    EXPECT_EQ(inner.calls["Ibaraki Mito 1"], 1);
}

TEST(GeocodingService, NonFatalErrorIsAFailure) {
    FakeGeocoder inner;
    inner.erroring.insert("Flaky");
    GeocodingService service(inner, RateLimiter(0.0, 0.0));

    Batch batch = {withAddress("08_1", "Flaky")};
    EXPECT_EQ(service.geocodeBatch(batch).failure, 1);
}

TEST(GeocodingService, FatalErrorStopsTheBatch) {
    FakeGeocoder inner;
    inner.quotaExhausted = true;
    GeocodingService service(inner, RateLimiter(0.0, 0.0));

    Batch batch = {withAddress("08_1", "Mito 1"), withAddress("08_2", "Mito 2")};
    const auto result = service.geocodeBatch(batch);

    EXPECT_EQ(result.success, 0);
    EXPECT_EQ(result.failure, 0);
    EXPECT_EQ(result.fatalError, "OVER_QUERY_LIMIT");
    EXPECT_EQ(inner.totalCalls, 1);
}

TEST(GeocodingService, FatalErrorKeepsCountsOfEarlierRecords) {
    FakeGeocoder inner;
    inner.known["Mito 1"] = at(36.3, 140.4);
    inner.known["Mito 2"] = at(36.4, 140.5);
    inner.quotaAfterCalls = 2;
    GeocodingService service(inner, RateLimiter(0.0, 0.0));

    Batch batch = {withAddress("08_1", "Mito 1"), withAddress("08_2", "Mito 2"),
                   withAddress("08_3", "Mito 3")};
    const auto result = service.geocodeBatch(batch);

    EXPECT_EQ(result.success, 2);
    EXPECT_FALSE(result.fatalError.empty());
    EXPECT_TRUE(batch[0].hasCoordinates());
    EXPECT_TRUE(batch[1].hasCoordinates());
    EXPECT_FALSE(batch[2].hasCoordinates());
}

TEST(GeocodingService, RepeatedAddressesHitTheCache) {
    FakeGeocoder inner;
    inner.known["Mito 1"] = at(36.3, 140.4);
    GeocodingService service(inner, RateLimiter(0.0, 0.0));

    Batch batch = {withAddress("08_1", "Mito 1"), withAddress("08_2", "Mito 1")};
    EXPECT_EQ(service.geocodeBatch(batch).success, 2);
    EXPECT_EQ(inner.totalCalls, 1);

    const auto stats = service.cacheStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->hits, 1);
}

TEST(GeocodingService, WithoutCacheEveryRecordIsLookedUp) {
    FakeGeocoder inner;
    inner.known["Mito 1"] = at(36.3, 140.4);
    GeocodingService service(inner, RateLimiter(0.0, 0.0), /*useCache=*/false);

    Batch batch = {withAddress("08_1", "Mito 1"), withAddress("08_2", "Mito 1")};
    service.geocodeBatch(batch);
    EXPECT_EQ(inner.totalCalls, 2);
    EXPECT_FALSE(service.cacheStats().has_value());
    EXPECT_EQ(service.cache(), nullptr);
}
