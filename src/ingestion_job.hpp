#pragma once

#include "batch_accumulator.hpp"
#include "checkpoint_store.hpp"
#include "crawl_controller.hpp"
#include "extractor.hpp"
#include "geocoder.hpp"
#include "history_store.hpp"
#include "link_deduplicator.hpp"
#include "notifier.hpp"
#include "rate_limiter.hpp"
#include "record_store.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Running totals of one run, threaded through the batch and page callbacks.
struct RunCounters {
    int processed         = 0;   // records persisted, seeded from the checkpoint
    int created           = 0;
    int updated           = 0;
    int skipped           = 0;   // rejected by the sink
    int geocoded          = 0;
    int geocodingFailures = 0;
    int failedBatches     = 0;
};

struct JobOptions {
    std::size_t        batchSize   = 50;
    FlushFailurePolicy flushPolicy = FlushFailurePolicy::LogAndContinue;
    CrawlOptions       crawl;
    RateLimiter        rateLimiter;
    std::string        geocodePrefix;   // prepended to addresses before lookup
};

/// One ingestion run of one source: resume from the checkpoint, crawl, then
/// geocode and persist batch by batch, checkpointing after every page.
///
/// execute() reports the ordinary failure taxonomy through the returned
/// result's status and errors rather than by throwing.
class IngestionJob {
public:
    /// @p geocoder and @p notifier may be null (feature disabled).
    IngestionJob(Extractor& extractor,
                 RecordSink& records,
                 CheckpointStore& checkpoints,
                 HistorySink& history,
                 JobOptions options,
                 GeocodingService* geocoder = nullptr,
                 Notifier* notifier = nullptr);

    /// Polled between pages.  Cancelling ends the run Partial and keeps the
    /// checkpoint.
    void setCancelFlag(const std::atomic<bool>* cancelFlag) { mCancelFlag = cancelFlag; }

    CrawlRunResult execute();

    const RunCounters&                            counters()   const { return mCounters; }
    const std::optional<CrawlController::Stats>& crawlStats() const { return mCrawlStats; }

private:
    Extractor&        mExtractor;
    RecordSink&       mRecords;
    CheckpointStore&  mCheckpoints;
    HistorySink&      mHistory;
    JobOptions        mOptions;
    GeocodingService* mGeocoder;
    Notifier*         mNotifier;
    LinkDeduplicator  mDedup;

    const std::atomic<bool>* mCancelFlag = nullptr;

    /// A finished page whose records are not all flushed yet.
    struct UncommittedPage {
        int         pageNumber;
        std::size_t recordsThrough;   // records accepted up to and including this page
    };

    // Per-run state.
    CrawlRunResult               mResult;
    RunCounters                  mCounters{};
    std::vector<int>             mCompletedPages;     // checkpointed
    std::vector<UncommittedPage> mUncommittedPages;
    std::size_t                  mRecordsAttempted = 0;
    bool                         mGeocodingHalted  = false;
    std::optional<CrawlController::Stats> mCrawlStats;

    void flushBatch(const Batch& batch);
    void onPageComplete(int pageNumber, std::size_t pendingRecords);

    /// Checkpoint every finished page whose records have all been through a
    /// flush, so a checkpoint never runs ahead of persistence.
    void commitPages();

    void finish(RunStatus status);

    std::string lastRecordId() const;
};

} // namespace shop_harvest
