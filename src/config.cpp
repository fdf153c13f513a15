#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace shop_harvest {

namespace {

constexpr const char* kTag = "Config";

/// Typed read of an optional key; a present key of the wrong type is an error.
template <typename T>
T readOr(const json& obj, const char* key, T fallback, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

const json& section(const json& obj, const char* key, const std::string& where) {
    static const json kEmpty = json::object();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return kEmpty;
    }
    if (!it->is_object()) {
        throw ConfigError(where + "." + key + " must be an object");
    }
    return *it;
}

RateLimitSettings parseRateLimit(const json& obj, const std::string& where) {
    RateLimitSettings rl;
    if (obj.contains("requests_per_second")) {
        rl.requestsPerSecond = readOr<double>(obj, "requests_per_second", 0.0, where);
        if (*rl.requestsPerSecond <= 0.0) {
            throw ConfigError(where + ".requests_per_second must be > 0");
        }
        return rl;
    }
    rl.minWait = readOr<double>(obj, "min_wait", rl.minWait, where);
    rl.maxWait = readOr<double>(obj, "max_wait", rl.maxWait, where);
    if (rl.minWait < 0.0 || rl.maxWait < rl.minWait) {
        throw ConfigError(where + ": need 0 <= min_wait <= max_wait");
    }
    return rl;
}

CrawlOptions parsePagination(const json& obj, const std::string& where) {
    CrawlOptions opts;
    opts.startPage         = readOr<int>(obj, "start_page", opts.startPage, where);
    opts.maxEmptyPages     = readOr<int>(obj, "max_empty_pages", opts.maxEmptyPages, where);
    opts.maxDuplicatePages = readOr<int>(obj, "max_duplicate_pages", opts.maxDuplicatePages, where);
    opts.maxPages          = readOr<int>(obj, "max_pages", opts.maxPages, where);
    if (obj.contains("end_page") && !obj["end_page"].is_null()) {
        opts.endPage = readOr<int>(obj, "end_page", 0, where);
    }

    if (opts.startPage < 1) {
        throw ConfigError(where + ".start_page must be >= 1");
    }
    if (opts.endPage && *opts.endPage < opts.startPage) {
        throw ConfigError(where + ".end_page must be >= start_page");
    }
    if (opts.maxEmptyPages < 1 || opts.maxDuplicatePages < 1) {
        throw ConfigError(where + ": max_empty_pages and max_duplicate_pages must be >= 1");
    }
    if (opts.maxPages < 0) {
        throw ConfigError(where + ".max_pages must be >= 0");
    }
    return opts;
}

SourceConfig parseSource(const json& obj, std::size_t index) {
    if (!obj.is_object()) {
        throw ConfigError("sources[" + std::to_string(index) + "] must be an object");
    }

    SourceConfig src;
    auto& layout = src.layout;
    layout.sourceId = readOr<std::string>(obj, "id", "", "sources[" + std::to_string(index) + "]");
    if (layout.sourceId.empty()) {
        throw ConfigError("sources[" + std::to_string(index) + "].id is required");
    }

    const std::string where = "sources[" + layout.sourceId + "]";
    layout.sourceName    = readOr<std::string>(obj, "name", layout.sourceId, where);
    layout.listUrl       = readOr<std::string>(obj, "list_url", "", where);
    layout.linksPointer  = readOr<std::string>(obj, "links_pointer", layout.linksPointer, where);
    layout.linkField     = readOr<std::string>(obj, "link_field", layout.linkField, where);
    layout.baseUrl       = readOr<std::string>(obj, "base_url", "", where);
    layout.recordPointer = readOr<std::string>(obj, "record_pointer", "", where);
    layout.fields        = readOr<std::map<std::string, std::string>>(obj, "fields", {}, where);

    if (layout.listUrl.empty()) {
        throw ConfigError(where + ".list_url is required");
    }

    const auto& session = section(obj, "session", where);
    layout.tokenUrl     = readOr<std::string>(session, "token_url", "", where + ".session");
    layout.tokenPointer = readOr<std::string>(session, "token_pointer", layout.tokenPointer,
                                              where + ".session");

    src.pagination    = parsePagination(section(obj, "pagination", where), where + ".pagination");
    src.rateLimit     = parseRateLimit(section(obj, "rate_limit", where), where + ".rate_limit");
    src.addressPrefix = readOr<std::string>(obj, "address_prefix", "", where);
    return src;
}

} // namespace

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

RateLimiter RateLimitSettings::makeLimiter() const {
    if (requestsPerSecond) {
        return RateLimiter::fromRequestsPerSecond(*requestsPerSecond);
    }
    return RateLimiter(minWait, maxWait);
}

// ---------------------------------------------------------------------------
// AppConfig
// ---------------------------------------------------------------------------

const SourceConfig* AppConfig::findSource(const std::string& id) const {
    for (const auto& src : sources) {
        if (src.id() == id) {
            return &src;
        }
    }
    return nullptr;
}

std::vector<const SourceConfig*> AppConfig::selectedSources() const {
    std::vector<const SourceConfig*> out;
    if (targetSources.empty()) {
        for (const auto& src : sources) {
            out.push_back(&src);
        }
        return out;
    }

    for (const auto& id : targetSources) {
        const auto* src = findSource(id);
        if (src == nullptr) {
            throw ConfigError("Unknown target source: " + id);
        }
        out.push_back(src);
    }
    return out;
}

void AppConfig::validateTargets() const {
    for (const auto& id : targetSources) {
        if (findSource(id) == nullptr) {
            throw ConfigError("Unknown target source: " + id);
        }
    }
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

AppConfig parseConfig(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    AppConfig cfg;
    const std::string root = "config";

    cfg.environment = readOr<std::string>(doc, "environment", cfg.environment, root);
    cfg.dataDir     = readOr<std::string>(doc, "data_dir", cfg.dataDir.string(), root);

    const int batchSize = readOr<int>(doc, "batch_size", static_cast<int>(cfg.batchSize), root);
    if (batchSize < 1) {
        throw ConfigError("batch_size must be >= 1");
    }
    cfg.batchSize = static_cast<std::size_t>(batchSize);

    const auto policy = readOr<std::string>(doc, "flush_failure_policy", "continue", root);
    if (policy == "continue") {
        cfg.flushPolicy = FlushFailurePolicy::LogAndContinue;
    } else if (policy == "propagate") {
        cfg.flushPolicy = FlushFailurePolicy::Propagate;
    } else {
        throw ConfigError("flush_failure_policy must be 'continue' or 'propagate', got '" +
                          policy + "'");
    }

    const auto& http = section(doc, "http", root);
    cfg.http.timeoutMs   = readOr<int>(http, "timeout_ms", cfg.http.timeoutMs, "http");
    cfg.http.maxAttempts = readOr<int>(http, "max_attempts", cfg.http.maxAttempts, "http");
    cfg.http.userAgent   = readOr<std::string>(http, "user_agent", cfg.http.userAgent, "http");
    if (cfg.http.timeoutMs <= 0 || cfg.http.maxAttempts < 1) {
        throw ConfigError("http.timeout_ms must be > 0 and http.max_attempts >= 1");
    }

    const auto& geo = section(doc, "geocoding", root);
    auto& g = cfg.geocoding;
    g.enabled           = readOr<bool>(geo, "enabled", g.enabled, "geocoding");
    g.cacheEnabled      = readOr<bool>(geo, "cache_enabled", g.cacheEnabled, "geocoding");
    g.requestsPerSecond = readOr<double>(geo, "requests_per_second", g.requestsPerSecond, "geocoding");
    g.apiKeyEnv         = readOr<std::string>(geo, "api_key_env", g.apiKeyEnv, "geocoding");
    g.endpoint          = readOr<std::string>(geo, "endpoint", g.endpoint, "geocoding");
    g.region            = readOr<std::string>(geo, "region", g.region, "geocoding");
    if (g.requestsPerSecond <= 0.0) {
        throw ConfigError("geocoding.requests_per_second must be > 0");
    }

    const auto& slack = section(doc, "slack", root);
    cfg.slack.enabled    = readOr<bool>(slack, "enabled", cfg.slack.enabled, "slack");
    cfg.slack.webhookEnv = readOr<std::string>(slack, "webhook_env", cfg.slack.webhookEnv, "slack");
    cfg.slack.channel    = readOr<std::string>(slack, "channel", "", "slack");

    cfg.targetSources = readOr<std::vector<std::string>>(doc, "target_sources", {}, root);

    auto sources = doc.find("sources");
    if (sources != doc.end()) {
        if (!sources->is_array()) {
            throw ConfigError("sources must be an array");
        }
        std::set<std::string> ids;
        for (std::size_t i = 0; i < sources->size(); ++i) {
            auto src = parseSource((*sources)[i], i);
            if (!ids.insert(src.id()).second) {
                throw ConfigError("Duplicate source id: " + src.id());
            }
            cfg.sources.push_back(std::move(src));
        }
    }

    cfg.validateTargets();
    return cfg;
}

void applyEnvironmentOverrides(AppConfig& config, const EnvLookup& env) {
    if (auto dir = env("SHOP_HARVEST_DATA_DIR"); dir && !dir->empty()) {
        config.dataDir = *dir;
    }

    if (auto size = env("SHOP_HARVEST_BATCH_SIZE"); size && !size->empty()) {
        int value = 0;
        try {
            value = std::stoi(*size);
        } catch (const std::exception&) {
            throw ConfigError("SHOP_HARVEST_BATCH_SIZE is not a number: " + *size);
        }
        if (value < 1) {
            throw ConfigError("SHOP_HARVEST_BATCH_SIZE must be >= 1");
        }
        config.batchSize = static_cast<std::size_t>(value);
    }

    if (auto targets = env("SHOP_HARVEST_TARGET_SOURCES"); targets && !targets->empty()) {
        config.targetSources = splitCommaList(*targets);
        config.validateTargets();
    }
}

void resolveSecrets(AppConfig& config, const EnvLookup& env) {
    if (config.geocoding.enabled) {
        auto key = env(config.geocoding.apiKeyEnv);
        if (!key || trim(*key).empty()) {
            throw ConfigError("Geocoding is enabled but " + config.geocoding.apiKeyEnv +
                              " is not set");
        }
        config.geocoding.apiKey = trim(*key);
    }

    if (config.slack.enabled) {
        auto url = env(config.slack.webhookEnv);
        if (!url || trim(*url).empty()) {
            SH_LOG_WARN(kTag, config.slack.webhookEnv << " is not set; Slack notifications disabled");
            config.slack.enabled = false;
        } else {
            config.slack.webhookUrl = trim(*url);
        }
    }
}

AppConfig loadConfig(const std::filesystem::path& path, const EnvLookup& env) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    auto config = parseConfig(doc);
    applyEnvironmentOverrides(config, env);
    resolveSecrets(config, env);

    SH_LOG_INFO(kTag, "Loaded " << path.string() << " (" << config.environment << ", "
                << config.sources.size() << " sources)");
    return config;
}

} // namespace shop_harvest
