#include "orchestrator.hpp"
#include "errors.hpp"
#include "ingestion_job.hpp"
#include "json_api_extractor.hpp"
#include "logging.hpp"
#include "notifier.hpp"

#include <thread>

namespace shop_harvest {

namespace {

constexpr const char* kTag = "Orchestrator";

std::unique_ptr<Extractor> makeJsonApiExtractor(const SourceConfig& source, HttpClient& http) {
    return std::make_unique<JsonApiExtractor>(http, source.layout);
}

} // namespace

/// Everything one job owns.
struct Orchestrator::JobContext {
    const SourceConfig*            source = nullptr;
    std::unique_ptr<HttpClient>    http;
    std::unique_ptr<Extractor>     extractor;
    std::unique_ptr<HttpClient>    notifyHttp;
    std::unique_ptr<SlackNotifier> notifier;
};

Orchestrator::Orchestrator(AppConfig config, DocumentStore& store)
    : mConfig(std::move(config))
    , mRecords(store)
    , mCheckpoints(store)
    , mHistory(store)
    , mFactory(makeJsonApiExtractor)
{
    if (mConfig.geocoding.enabled) {
        GoogleMapsGeocoder::Options geoOptions;
        geoOptions.endpoint = mConfig.geocoding.endpoint;
        geoOptions.apiKey   = mConfig.geocoding.apiKey;
        geoOptions.region   = mConfig.geocoding.region;

        mGeoHttp   = std::make_unique<HttpClient>(httpOptions());
        mGeocoder  = std::make_unique<GoogleMapsGeocoder>(*mGeoHttp, geoOptions);
        mGeocoding = std::make_unique<GeocodingService>(
            *mGeocoder,
            RateLimiter::fromRequestsPerSecond(mConfig.geocoding.requestsPerSecond),
            mConfig.geocoding.cacheEnabled);
    } else {
        SH_LOG_INFO(kTag, "Geocoding disabled");
    }
}

HttpClient::Options Orchestrator::httpOptions() const {
    HttpClient::Options options;
    options.timeoutMs   = mConfig.http.timeoutMs;
    options.maxAttempts = mConfig.http.maxAttempts;
    options.userAgent   = mConfig.http.userAgent;
    return options;
}

// ---------------------------------------------------------------------------
// Job assembly
// ---------------------------------------------------------------------------

std::unique_ptr<Orchestrator::JobContext> Orchestrator::prepare(const SourceConfig& source) {
    auto context = std::make_unique<JobContext>();
    context->source    = &source;
    context->http      = std::make_unique<HttpClient>(httpOptions());
    context->extractor = mFactory(source, *context->http);
    if (!context->extractor) {
        throw ConfigError("No extractor for source " + source.id());
    }

    if (mConfig.slack.enabled) {
        SlackNotifier::Options slackOptions;
        slackOptions.webhookUrl = mConfig.slack.webhookUrl;
        slackOptions.channel    = mConfig.slack.channel;

        context->notifyHttp = std::make_unique<HttpClient>(httpOptions());
        context->notifier   = std::make_unique<SlackNotifier>(*context->notifyHttp, slackOptions);
    }
    return context;
}

CrawlRunResult Orchestrator::run(JobContext& context) {
    const auto& source = *context.source;

    JobOptions options;
    options.batchSize     = mConfig.batchSize;
    options.flushPolicy   = mConfig.flushPolicy;
    options.crawl         = source.pagination;
    options.rateLimiter   = source.rateLimit.makeLimiter();
    options.geocodePrefix = source.addressPrefix;

    IngestionJob job(*context.extractor, mRecords, mCheckpoints, mHistory, std::move(options),
                     mGeocoding.get(), context.notifier.get());
    job.setCancelFlag(mCancelFlag);
    auto result = job.execute();

    const auto stats = context.http->stats();
    SH_LOG_DEBUG(kTag, source.id() << ": " << stats.totalRequests << " HTTP requests, "
                 << stats.totalRetries << " retries");
    return result;
}

// ---------------------------------------------------------------------------
// Public
// ---------------------------------------------------------------------------

CrawlRunResult Orchestrator::runSource(const std::string& sourceId) {
    const auto* source = mConfig.findSource(sourceId);
    if (source == nullptr) {
        throw ConfigError("Unknown source: " + sourceId);
    }
    auto context = prepare(*source);
    return run(*context);
}

std::vector<CrawlRunResult> Orchestrator::runAll(bool parallel) {
    const auto sources = mConfig.selectedSources();

    std::vector<std::unique_ptr<JobContext>> contexts;
    contexts.reserve(sources.size());
    for (const auto* source : sources) {
        contexts.push_back(prepare(*source));
    }

    SH_LOG_INFO(kTag, "Running " << contexts.size() << " source(s)"
                << (parallel ? " in parallel" : ""));

    std::vector<CrawlRunResult> results(contexts.size());

    if (!parallel) {
        for (std::size_t i = 0; i < contexts.size(); ++i) {
            if (mCancelFlag != nullptr && mCancelFlag->load()) {
                SH_LOG_WARN(kTag, "Cancelled; " << contexts.size() - i << " source(s) not run");
                results.resize(i);
                break;
            }
            results[i] = run(*contexts[i]);
        }
        return results;
    }

    std::vector<std::thread> workers;
    workers.reserve(contexts.size());
    for (std::size_t i = 0; i < contexts.size(); ++i) {
        workers.emplace_back([this, &contexts, &results, i]() {
            try {
                results[i] = run(*contexts[i]);
            } catch (const std::exception& e) {
                // Job failures are in the result; this is anything else.
                SH_LOG_ERROR(kTag, contexts[i]->source->id() << ": worker failed: " << e.what());
                results[i].sourceId   = contexts[i]->source->id();
                results[i].sourceName = contexts[i]->source->name();
                results[i].status     = RunStatus::Failed;
                results[i].errors.push_back(e.what());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return results;
}

} // namespace shop_harvest
