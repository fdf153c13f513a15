#pragma once

#include "models.hpp"

#include <cstddef>
#include <functional>

namespace shop_harvest {

/// What happens when the flush callback throws.
enum class FlushFailurePolicy {
    LogAndContinue,   // log, drop the batch, keep crawling
    Propagate,        // drop the batch, then rethrow to the caller
};

/// Buffers records and hands them to a flush callback in batches of at most
/// batchSize.  Every batch is flushed exactly once; a failed flush is never
/// retried.
class BatchAccumulator {
public:
    using FlushCallback = std::function<void(const Batch&)>;

    struct Stats {
        int batchesFlushed = 0;
        int failedFlushes  = 0;
        int recordsFlushed = 0;   // records in successful flushes only
    };

    /// @throws std::invalid_argument if @p batchSize < 1.
    BatchAccumulator(std::size_t batchSize,
                     FlushCallback onFlush,
                     FlushFailurePolicy policy = FlushFailurePolicy::LogAndContinue);

    /// Append a record; flushes when the batch reaches batchSize.
    void add(CrawlRecord record);

    /// Flush the non-empty remainder.  No-op when empty.
    void drain();

    std::size_t pending()   const { return mCurrent.size(); }
    std::size_t batchSize() const { return mBatchSize; }
    Stats       stats()     const { return mStats; }

private:
    std::size_t        mBatchSize;
    FlushCallback      mOnFlush;
    FlushFailurePolicy mPolicy;
    Batch              mCurrent;
    Stats              mStats{};

    void flush();
};

} // namespace shop_harvest
