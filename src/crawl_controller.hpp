#pragma once

#include "batch_accumulator.hpp"
#include "extractor.hpp"
#include "link_deduplicator.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <functional>
#include <optional>

namespace shop_harvest {

/// Pagination settings for one crawl.
struct CrawlOptions {
    int                startPage         = 1;
    std::optional<int> endPage;            // unset => auto-detect termination
    int                maxEmptyPages     = 3;
    int                maxDuplicatePages = 3;
    int                maxPages          = 0;   // auto-detect safety cap, 0 = none
};

enum class CrawlState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Aborted,
};

enum class TerminationReason {
    None,
    EndPageReached,
    EmptyPages,
    DuplicatePages,
    PageLimitReached,
    Cancelled,
    Aborted,
};

const char* toString(CrawlState state);
const char* toString(TerminationReason reason);

/// Walks one source's listing pages in increasing order, deduplicating links,
/// feeding parsed records to a BatchAccumulator and reporting each finished
/// page, until an end-page, empty-streak or duplicate-streak condition fires.
class CrawlController {
public:
    using PageCompleteCallback = std::function<void(int pageNumber)>;

    struct Stats {
        int pagesVisited      = 0;
        int emptyPages        = 0;
        int duplicatePages    = 0;
        int listFailures      = 0;
        int linksDiscovered   = 0;
        int duplicateLinks    = 0;
        int recordsParsed     = 0;
        int parseFailures     = 0;
        int lastCompletedPage = 0;
    };

    CrawlController(Extractor& extractor,
                    RateLimiter& rateLimiter,
                    LinkDeduplicator& dedup,
                    CrawlOptions options);

    /// Polled after every page-complete callback; true stops the crawl.
    void setCancelFlag(const std::atomic<bool>* cancelFlag) { mCancelFlag = cancelFlag; }

    /// Crawl until a termination condition fires, then drain @p batches.
    /// @throws SessionError after entering Aborted (nothing is drained).
    /// @throws whatever @p batches propagates under FlushFailurePolicy::Propagate.
    TerminationReason run(BatchAccumulator& batches,
                          const PageCompleteCallback& onPageComplete = {});

    CrawlState state() const { return mState; }
    Stats      stats() const { return mStats; }

private:
    Extractor&               mExtractor;
    RateLimiter&             mRateLimiter;
    LinkDeduplicator&        mDedup;
    CrawlOptions             mOptions;
    const std::atomic<bool>* mCancelFlag = nullptr;
    CrawlState               mState      = CrawlState::Idle;
    Stats                    mStats{};

    std::vector<std::string> fetchPageLinks(int pageNumber);

    void processLinks(const std::vector<std::string>& links, BatchAccumulator& batches);

    bool cancelRequested() const {
        return mCancelFlag != nullptr && mCancelFlag->load();
    }
};

} // namespace shop_harvest
