#pragma once

#include "batch_accumulator.hpp"
#include "crawl_controller.hpp"
#include "json_api_extractor.hpp"
#include "rate_limiter.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Environment lookup, injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the process environment.
std::optional<std::string> processEnv(const std::string& name);

struct HttpSettings {
    int         timeoutMs   = 20000;
    int         maxAttempts = 3;
    std::string userAgent   = "shop_harvest/1.0";
};

struct GeocodingSettings {
    bool        enabled           = false;
    bool        cacheEnabled      = true;
    double      requestsPerSecond = 50.0;
    std::string apiKeyEnv         = "GOOGLE_MAPS_API_KEY";
    std::string endpoint          = "https://maps.googleapis.com/maps/api/geocode/json";
    std::string region            = "jp";
    std::string apiKey;            // resolved from apiKeyEnv
};

struct SlackSettings {
    bool        enabled    = false;
    std::string webhookEnv = "SLACK_WEBHOOK_URL";
    std::string channel;
    std::string webhookUrl;        // resolved from webhookEnv
};

/// Either an explicit [minWait, maxWait] or a target request rate.
struct RateLimitSettings {
    double                minWait = 1.0;
    double                maxWait = 2.0;
    std::optional<double> requestsPerSecond;

    RateLimiter makeLimiter() const;
};

struct SourceConfig {
    JsonApiLayout     layout;          // carries id and name
    CrawlOptions      pagination;
    RateLimitSettings rateLimit;
    std::string       addressPrefix;   // prepended to addresses for geocoding

    const std::string& id()   const { return layout.sourceId; }
    const std::string& name() const { return layout.sourceName; }
};

struct AppConfig {
    std::string           environment = "development";
    std::filesystem::path dataDir     = "./data";
    std::size_t           batchSize   = 50;
    FlushFailurePolicy    flushPolicy = FlushFailurePolicy::LogAndContinue;

    HttpSettings      http;
    GeocodingSettings geocoding;
    SlackSettings     slack;

    std::vector<std::string>  targetSources;   // empty: every source
    std::vector<SourceConfig> sources;

    /// nullptr when unknown.
    const SourceConfig* findSource(const std::string& id) const;

    /// Sources named by targetSources, in that order, or all sources.
    /// @throws ConfigError for an unknown id.
    std::vector<const SourceConfig*> selectedSources() const;

    /// @throws ConfigError if targetSources names an unknown source.
    void validateTargets() const;
};

/// Build a config from its JSON document.  @throws ConfigError.
AppConfig parseConfig(const nlohmann::json& doc);

/// SHOP_HARVEST_DATA_DIR, SHOP_HARVEST_BATCH_SIZE, SHOP_HARVEST_TARGET_SOURCES.
/// @throws ConfigError on malformed values.
void applyEnvironmentOverrides(AppConfig& config, const EnvLookup& env = processEnv);

/// Read API key and webhook URL from the variables the config names.  A
/// missing geocoding key is an error; a missing webhook disables Slack.
/// @throws ConfigError.
void resolveSecrets(AppConfig& config, const EnvLookup& env = processEnv);

/// parseConfig + applyEnvironmentOverrides + resolveSecrets on a file.
/// @throws ConfigError.
AppConfig loadConfig(const std::filesystem::path& path, const EnvLookup& env = processEnv);

} // namespace shop_harvest
