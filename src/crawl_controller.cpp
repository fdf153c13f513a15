#include "crawl_controller.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <unordered_set>
#include <utility>

namespace shop_harvest {

namespace {

using PageLinkSet = std::unordered_set<std::string>;

constexpr const char* kTag = "CrawlController";

} // namespace

const char* toString(CrawlState state) {
    switch (state) {
        case CrawlState::Idle:      return "idle";
        case CrawlState::Running:   return "running";
        case CrawlState::Completed: return "completed";
        case CrawlState::Cancelled: return "cancelled";
        case CrawlState::Aborted:   return "aborted";
    }
    return "unknown";
}

const char* toString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None:             return "none";
        case TerminationReason::EndPageReached:   return "end page reached";
        case TerminationReason::EmptyPages:       return "consecutive empty pages";
        case TerminationReason::DuplicatePages:   return "consecutive duplicate pages";
        case TerminationReason::PageLimitReached: return "page limit reached";
        case TerminationReason::Cancelled:        return "cancelled";
        case TerminationReason::Aborted:          return "aborted";
    }
    return "unknown";
}

CrawlController::CrawlController(Extractor& extractor,
                                 RateLimiter& rateLimiter,
                                 LinkDeduplicator& dedup,
                                 CrawlOptions options)
    : mExtractor(extractor)
    , mRateLimiter(rateLimiter)
    , mDedup(dedup)
    , mOptions(std::move(options)) {}

// ---------------------------------------------------------------------------
// Public: page loop
// ---------------------------------------------------------------------------

TerminationReason CrawlController::run(BatchAccumulator& batches,
                                       const PageCompleteCallback& onPageComplete)
{
    mState = CrawlState::Running;
    mStats = Stats{};

    const bool autoDetect = !mOptions.endPage.has_value();
    TerminationReason reason = TerminationReason::None;

    if (autoDetect) {
        SH_LOG_INFO(kTag, mExtractor.sourceId() << ": crawling from page "
                    << mOptions.startPage << " with auto-detect (max_empty_pages="
                    << mOptions.maxEmptyPages << ", max_duplicate_pages="
                    << mOptions.maxDuplicatePages << ")");
    } else {
        SH_LOG_INFO(kTag, mExtractor.sourceId() << ": crawling pages "
                    << mOptions.startPage << " to " << *mOptions.endPage);
    }

    try {
        mExtractor.openSession();

        int emptyStreak     = 0;
        int duplicateStreak = 0;
        std::optional<PageLinkSet> previousLinks;

        for (int page = mOptions.startPage;; ++page) {
            // --- fixed-range / safety-cap termination ---
            if (!autoDetect && page > *mOptions.endPage) {
                reason = TerminationReason::EndPageReached;
                break;
            }
            if (autoDetect && mOptions.maxPages > 0 &&
                mStats.pagesVisited >= mOptions.maxPages) {
                reason = TerminationReason::PageLimitReached;
                break;
            }

            mRateLimiter.wait();
            const auto links = fetchPageLinks(page);
            ++mStats.pagesVisited;

            // --- auto-detect termination ---
            if (autoDetect) {
                if (links.empty()) {
                    ++emptyStreak;
                    ++mStats.emptyPages;
                    SH_LOG_INFO(kTag, "No links on page " << page << " (empty streak "
                                << emptyStreak << "/" << mOptions.maxEmptyPages << ")");
                    if (emptyStreak >= mOptions.maxEmptyPages) {
                        reason = TerminationReason::EmptyPages;
                        break;
                    }
                } else {
                    emptyStreak = 0;

                    PageLinkSet current(links.begin(), links.end());
                    if (previousLinks && *previousLinks == current) {
                        ++duplicateStreak;
                        ++mStats.duplicatePages;
                        SH_LOG_INFO(kTag, "Page " << page << " repeats the previous page ("
                                    << duplicateStreak << "/" << mOptions.maxDuplicatePages << ")");
                        if (duplicateStreak >= mOptions.maxDuplicatePages) {
                            reason = TerminationReason::DuplicatePages;
                            break;
                        }
                    } else {
                        duplicateStreak = 0;
                    }
                    previousLinks = std::move(current);
                }
            }

            processLinks(links, batches);

            if (onPageComplete) {
                try {
                    onPageComplete(page);
                } catch (const SessionError&) {
                    throw;
                } catch (const std::exception& e) {
                    SH_LOG_ERROR(kTag, "Page-complete callback failed for page "
                                 << page << ": " << e.what());
                }
            }
            mStats.lastCompletedPage = page;

            SH_LOG_DEBUG(kTag, "Page " << page << " done: " << links.size()
                         << " links, " << mStats.recordsParsed << " records so far");

            if (cancelRequested()) {
                reason = TerminationReason::Cancelled;
                break;
            }
        }

        batches.drain();

    } catch (const std::exception& e) {
        mState = CrawlState::Aborted;
        SH_LOG_ERROR(kTag, mExtractor.sourceId() << ": crawl aborted: " << e.what());
        throw;
    }

    mState = (reason == TerminationReason::Cancelled) ? CrawlState::Cancelled
                                                      : CrawlState::Completed;

    SH_LOG_INFO(kTag, mExtractor.sourceId() << ": stopped (" << toString(reason) << ") after "
                << mStats.pagesVisited << " pages, " << mStats.recordsParsed << " records, "
                << mStats.duplicateLinks << " duplicate links skipped");
    return reason;
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

std::vector<std::string> CrawlController::fetchPageLinks(int pageNumber) {
    try {
        return mExtractor.listPage(pageNumber);
    } catch (const SessionError&) {
        throw;
    } catch (const HarvestError& e) {
        // Counted as an empty page; retry is the transport's job.
        ++mStats.listFailures;
        SH_LOG_ERROR(kTag, "Failed to list page " << pageNumber << ": " << e.what());
        return {};
    }
}

void CrawlController::processLinks(const std::vector<std::string>& links,
                                   BatchAccumulator& batches)
{
    for (const auto& link : links) {
        ++mStats.linksDiscovered;

        if (!mDedup.markIfNew(link)) {
            ++mStats.duplicateLinks;
            continue;
        }

        mRateLimiter.wait();

        std::optional<CrawlRecord> record;
        try {
            record = mExtractor.fetchRecord(link);
        } catch (const SessionError&) {
            throw;
        } catch (const HarvestError& e) {
            ++mStats.parseFailures;
            SH_LOG_WARN(kTag, "Skipping " << link << ": " << e.what());
            continue;
        }

        if (!record) {
            ++mStats.parseFailures;
            SH_LOG_WARN(kTag, "Skipping " << link << ": no record parsed");
            continue;
        }

        ++mStats.recordsParsed;
        batches.add(std::move(*record));
    }
}

} // namespace shop_harvest
