#pragma once

#include "checkpoint_store.hpp"
#include "config.hpp"
#include "document_store.hpp"
#include "extractor.hpp"
#include "geocoder.hpp"
#include "history_store.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include "record_store.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace shop_harvest {

/// Runs ingestion jobs for configured sources against one document store.
///
/// Stores and the geocoding service are shared between jobs; each job gets
/// its own HTTP client, extractor, rate limiter and link deduplicator.
class Orchestrator {
public:
    using ExtractorFactory =
        std::function<std::unique_ptr<Extractor>(const SourceConfig&, HttpClient&)>;

    /// @throws ConfigError if geocoding is enabled without an API key.
    Orchestrator(AppConfig config, DocumentStore& store);

    /// Replace the JsonApiExtractor default.
    void setExtractorFactory(ExtractorFactory factory) { mFactory = std::move(factory); }

    void setCancelFlag(const std::atomic<bool>* cancelFlag) { mCancelFlag = cancelFlag; }

    /// @throws ConfigError for an unknown or invalid source.
    CrawlRunResult runSource(const std::string& sourceId);

    /// Every selected source, sequentially or one thread per source.
    /// Results come back in selection order.
    /// @throws ConfigError before any job starts if a source is invalid.
    std::vector<CrawlRunResult> runAll(bool parallel = false);

    const AppConfig& config() const { return mConfig; }

    DocumentRecordStore&     records()     { return mRecords; }
    DocumentCheckpointStore& checkpoints() { return mCheckpoints; }
    DocumentHistoryStore&    history()     { return mHistory; }

private:
    struct JobContext;

    AppConfig               mConfig;
    DocumentRecordStore     mRecords;
    DocumentCheckpointStore mCheckpoints;
    DocumentHistoryStore    mHistory;
    ExtractorFactory        mFactory;

    std::unique_ptr<HttpClient>         mGeoHttp;
    std::unique_ptr<GoogleMapsGeocoder> mGeocoder;
    std::unique_ptr<GeocodingService>   mGeocoding;

    const std::atomic<bool>* mCancelFlag = nullptr;

    HttpClient::Options httpOptions() const;
    std::unique_ptr<JobContext> prepare(const SourceConfig& source);
    CrawlRunResult run(JobContext& context);
};

} // namespace shop_harvest
