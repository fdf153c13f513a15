#include "ingestion_job.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <utility>

namespace shop_harvest {

namespace {

constexpr const char* kTag = "IngestionJob";

} // namespace

IngestionJob::IngestionJob(Extractor& extractor,
                           RecordSink& records,
                           CheckpointStore& checkpoints,
                           HistorySink& history,
                           JobOptions options,
                           GeocodingService* geocoder,
                           Notifier* notifier)
    : mExtractor(extractor)
    , mRecords(records)
    , mCheckpoints(checkpoints)
    , mHistory(history)
    , mOptions(std::move(options))
    , mGeocoder(geocoder)
    , mNotifier(notifier) {}

// ---------------------------------------------------------------------------
// Public: run
// ---------------------------------------------------------------------------

CrawlRunResult IngestionJob::execute() {
    const std::string sourceId   = mExtractor.sourceId();
    const std::string sourceName = mExtractor.sourceName();

    mResult            = CrawlRunResult{};
    mResult.runId      = generateRunId(sourceId);
    mResult.sourceId   = sourceId;
    mResult.sourceName = sourceName;
    mResult.startedAt  = Clock::now();
    mResult.status     = RunStatus::Running;

    mCounters        = RunCounters{};
    mCompletedPages.clear();
    mUncommittedPages.clear();
    mRecordsAttempted = 0;
    mGeocodingHalted  = false;
    mCrawlStats.reset();
    mDedup.clear();
    mOptions.rateLimiter.reset();

    SH_LOG_INFO(kTag, "Run " << mResult.runId << " started for " << sourceName
                << " (" << sourceId << ")");

    if (mNotifier != nullptr) {
        try {
            mNotifier->notifyStart(sourceId, sourceName);
        } catch (const HarvestError& e) {
            SH_LOG_WARN(kTag, "Start notification failed: " << e.what());
        }
    }

    RunStatus status = RunStatus::Failed;

    try {
        CrawlOptions crawl = mOptions.crawl;

        if (auto checkpoint = mCheckpoints.get(sourceId)) {
            if (!checkpoint->completedPages.empty()) {
                mCompletedPages     = checkpoint->completedPages;
                mCounters.processed = checkpoint->totalSaved;
                crawl.startPage     = std::max(checkpoint->resumePage(crawl.startPage),
                                               crawl.startPage);
                SH_LOG_INFO(kTag, "Resuming " << sourceId << " at page " << crawl.startPage
                            << " (" << mCompletedPages.size() << " pages, "
                            << checkpoint->totalSaved << " records already saved)");
            }
        }

        BatchAccumulator batches(mOptions.batchSize,
                                 [this](const Batch& batch) { flushBatch(batch); },
                                 mOptions.flushPolicy);

        CrawlController controller(mExtractor, mOptions.rateLimiter, mDedup, crawl);
        controller.setCancelFlag(mCancelFlag);

        TerminationReason reason = TerminationReason::None;
        try {
            reason = controller.run(batches, [this, &batches](int pageNumber) {
                onPageComplete(pageNumber, batches.pending());
            });
        } catch (const std::exception&) {
            mCrawlStats              = controller.stats();
            mCounters.failedBatches  = batches.stats().failedFlushes;
            throw;
        }
        mCrawlStats             = controller.stats();
        mCounters.failedBatches = batches.stats().failedFlushes;

        if (mCounters.failedBatches > 0) {
            status = RunStatus::Failed;
        } else if (reason == TerminationReason::Cancelled) {
            mResult.errors.push_back("Cancelled after page " +
                                     std::to_string(mCrawlStats->lastCompletedPage));
            status = RunStatus::Partial;
        } else if (mGeocodingHalted) {
            status = RunStatus::Partial;
        } else {
            status = RunStatus::Success;
        }

    } catch (const SessionError& e) {
        SH_LOG_ERROR(kTag, "Session failure for " << sourceId << ": " << e.what());
        mResult.errors.push_back(std::string("Session failure: ") + e.what());
        status = RunStatus::Failed;
    } catch (const PersistenceError& e) {
        SH_LOG_ERROR(kTag, "Persistence failure for " << sourceId << ": " << e.what());
        mResult.errors.push_back(std::string("Persistence failure: ") + e.what());
        status = RunStatus::Failed;
    } catch (const EnrichmentError& e) {
        SH_LOG_ERROR(kTag, "Enrichment failure for " << sourceId << ": " << e.what());
        mResult.errors.push_back(std::string("Enrichment failure: ") + e.what());
        status = RunStatus::Partial;
    } catch (const HarvestError& e) {
        SH_LOG_ERROR(kTag, "Run failed for " << sourceId << ": " << e.what());
        mResult.errors.push_back(e.what());
        status = RunStatus::Failed;
    } catch (const std::exception& e) {
        SH_LOG_ERROR(kTag, "Unexpected error for " << sourceId << ": " << e.what());
        mResult.errors.push_back(std::string("Unexpected error: ") + e.what());
        status = RunStatus::Failed;
    }

    finish(status);
    return mResult;
}

// ---------------------------------------------------------------------------
// Callbacks
// ---------------------------------------------------------------------------

void IngestionJob::flushBatch(const Batch& batch) {
    mRecordsAttempted += batch.size();
    Batch records = batch;

    if (mGeocoder != nullptr && !mGeocodingHalted) {
        const auto geo = mGeocoder->geocodeBatch(records, mOptions.geocodePrefix);
        mCounters.geocoded          += geo.success;
        mCounters.geocodingFailures += geo.failure;
        if (!geo.fatalError.empty()) {
            // Quota or key problem: every further lookup would fail the same way.
            mGeocodingHalted = true;
            SH_LOG_ERROR(kTag, "Geocoding halted: " << geo.fatalError);
            mResult.errors.push_back("Geocoding halted: " + geo.fatalError);
        }
    }

    try {
        const auto upsert = mRecords.upsertBatch(records);
        mCounters.created   += upsert.created;
        mCounters.updated   += upsert.updated;
        mCounters.skipped   += upsert.skipped;
        mCounters.processed += upsert.created + upsert.updated;
    } catch (const HarvestError& e) {
        // Dropped, not retried: its pages still count as attempted.
        mResult.errors.push_back("Batch of " + std::to_string(records.size()) +
                                 " records not persisted: " + e.what());
        commitPages();
        throw;
    }

    SH_LOG_INFO(kTag, mResult.sourceId << ": " << mCounters.processed << " records saved ("
                << mCounters.created << " new, " << mCounters.updated << " updated)");
    commitPages();
}

void IngestionJob::onPageComplete(int pageNumber, std::size_t pendingRecords) {
    mUncommittedPages.push_back({pageNumber, mRecordsAttempted + pendingRecords});
    commitPages();
}

void IngestionJob::commitPages() {
    auto firstOpen = std::find_if(mUncommittedPages.begin(), mUncommittedPages.end(),
                                  [this](const UncommittedPage& p) {
                                      return p.recordsThrough > mRecordsAttempted;
                                  });
    if (firstOpen == mUncommittedPages.begin()) {
        return;
    }

    for (auto it = mUncommittedPages.begin(); it != firstOpen; ++it) {
        mCompletedPages.push_back(it->pageNumber);
    }
    const int lastPage = std::prev(firstOpen)->pageNumber;
    mUncommittedPages.erase(mUncommittedPages.begin(), firstOpen);

    try {
        mCheckpoints.save(mResult.sourceId, mCompletedPages, mCounters.processed,
                          lastRecordId());
        SH_LOG_DEBUG(kTag, "Checkpointed " << mResult.sourceId << " through page " << lastPage);
    } catch (const HarvestError& e) {
        SH_LOG_ERROR(kTag, "Checkpoint save failed after page " << lastPage << ": "
                     << e.what());
        mResult.errors.push_back("Checkpoint save failed after page " +
                                 std::to_string(lastPage) + ": " + e.what());
    }
}

std::string IngestionJob::lastRecordId() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%05d", mCounters.processed);
    return mResult.sourceId + "_" + buffer;
}

// ---------------------------------------------------------------------------
// Terminal branch
// ---------------------------------------------------------------------------

void IngestionJob::finish(RunStatus status) {
    mResult.status       = status;
    mResult.completedAt  = Clock::now();
    mResult.durationSeconds =
        std::chrono::duration<double>(*mResult.completedAt - mResult.startedAt).count();

    mResult.totalRecords      = mCounters.processed;
    mResult.newRecords        = mCounters.created;
    mResult.updatedRecords    = mCounters.updated;
    mResult.geocodedRecords   = mCounters.geocoded;
    mResult.geocodingFailures = mCounters.geocodingFailures;
    mResult.failedBatches     = mCounters.failedBatches;
    mResult.pagesCompleted    = static_cast<int>(uniquePages(mCompletedPages).size());

    if (status == RunStatus::Success) {
        try {
            mCheckpoints.clear(mResult.sourceId);
        } catch (const HarvestError& e) {
            SH_LOG_WARN(kTag, "Could not clear checkpoint of " << mResult.sourceId << ": "
                        << e.what());
        }
    }

    try {
        mHistory.save(mResult);
    } catch (const HarvestError& e) {
        SH_LOG_ERROR(kTag, "Failed to save run history " << mResult.runId << ": " << e.what());
    }

    if (mNotifier != nullptr) {
        try {
            if (status == RunStatus::Failed) {
                mNotifier->notifyError(mResult.sourceId, mResult.sourceName,
                                       mResult.errors.empty() ? "run failed"
                                                              : mResult.errors.back());
            } else {
                mNotifier->notifyComplete(mResult);
            }
        } catch (const HarvestError& e) {
            SH_LOG_WARN(kTag, "Completion notification failed: " << e.what());
        }
    }

    SH_LOG_INFO(kTag, "Run " << mResult.runId << " finished: " << toString(status)
                << ", " << mResult.totalRecords << " records (" << mResult.newRecords
                << " new, " << mResult.updatedRecords << " updated, "
                << mResult.geocodedRecords << " geocoded) in "
                << *mResult.durationSeconds << "s");
}

} // namespace shop_harvest
