#include "batch_accumulator.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <utility>

namespace shop_harvest {

BatchAccumulator::BatchAccumulator(std::size_t batchSize,
                                   FlushCallback onFlush,
                                   FlushFailurePolicy policy)
    : mBatchSize(batchSize)
    , mOnFlush(std::move(onFlush))
    , mPolicy(policy)
{
    if (mBatchSize < 1) {
        throw std::invalid_argument("BatchAccumulator: batch_size must be >= 1");
    }
    mCurrent.reserve(mBatchSize);
}

void BatchAccumulator::add(CrawlRecord record) {
    mCurrent.push_back(std::move(record));
    if (mCurrent.size() >= mBatchSize) {
        flush();
    }
}

void BatchAccumulator::drain() {
    if (!mCurrent.empty()) {
        flush();
    }
}

void BatchAccumulator::flush() {
    // Detach first: the batch is gone whether or not the callback succeeds.
    Batch batch;
    batch.swap(mCurrent);
    mCurrent.reserve(mBatchSize);

    try {
        if (mOnFlush) {
            mOnFlush(batch);
        }
        ++mStats.batchesFlushed;
        mStats.recordsFlushed += static_cast<int>(batch.size());
    } catch (const std::exception& e) {
        ++mStats.failedFlushes;
        SH_LOG_ERROR("BatchAccumulator", "Flush of " << batch.size()
                     << " records failed: " << e.what());
        if (mPolicy == FlushFailurePolicy::Propagate) {
            throw;
        }
    }
}

} // namespace shop_harvest
