/// @file test_batch_accumulator.cpp
/// Unit tests for batch_accumulator.hpp: batch sizing and flush failure policy.

#include "batch_accumulator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace shop_harvest;

namespace {

CrawlRecord makeRecord(int n) {
    CrawlRecord r;
    r.sourceId   = "08";
    r.naturalKey = "08_" + std::to_string(n);
    r.name       = "Shop " + std::to_string(n);
    return r;
}

} // namespace

// ============================================================================
// Sizing
// ============================================================================

TEST(BatchAccumulator, OneHundredTwentyRecordsFlushAsFiftyFiftyTwenty) {
    std::vector<std::size_t> sizes;
    BatchAccumulator acc(50, [&](const Batch& b) { sizes.push_back(b.size()); });

    for (int i = 0; i < 120; ++i) {
        acc.add(makeRecord(i));
    }
    EXPECT_EQ(sizes, (std::vector<std::size_t>{50, 50}));
    EXPECT_EQ(acc.pending(), 20u);

    acc.drain();
    EXPECT_EQ(sizes, (std::vector<std::size_t>{50, 50, 20}));
    EXPECT_EQ(acc.pending(), 0u);

    const auto stats = acc.stats();
    EXPECT_EQ(stats.batchesFlushed, 3);
    EXPECT_EQ(stats.recordsFlushed, 120);
    EXPECT_EQ(stats.failedFlushes, 0);
}

TEST(BatchAccumulator, RecordsKeepInsertionOrder) {
    std::vector<std::string> keys;
    BatchAccumulator acc(2, [&](const Batch& b) {
        for (const auto& r : b) keys.push_back(r.naturalKey);
    });
    for (int i = 0; i < 5; ++i) acc.add(makeRecord(i));
    acc.drain();

    EXPECT_EQ(keys, (std::vector<std::string>{"08_0", "08_1", "08_2", "08_3", "08_4"}));
}

TEST(BatchAccumulator, DrainOnEmptyIsNoOp) {
    int calls = 0;
    BatchAccumulator acc(10, [&](const Batch&) { ++calls; });
    acc.drain();
    acc.drain();
    EXPECT_EQ(calls, 0);
}

TEST(BatchAccumulator, ExactMultipleLeavesNothingToDrain) {
    int calls = 0;
    BatchAccumulator acc(3, [&](const Batch&) { ++calls; });
    for (int i = 0; i < 6; ++i) acc.add(makeRecord(i));
    acc.drain();
    EXPECT_EQ(calls, 2);
}

TEST(BatchAccumulator, ZeroBatchSizeThrows) {
    EXPECT_THROW(BatchAccumulator(0, [](const Batch&) {}), std::invalid_argument);
}

// ============================================================================
// Flush failures
// ============================================================================

TEST(BatchAccumulator, FailedFlushIsNotRetriedAndCrawlContinues) {
    int calls = 0;
    std::vector<std::size_t> delivered;
    BatchAccumulator acc(2, [&](const Batch& b) {
        ++calls;
        if (calls == 1) throw std::runtime_error("store offline");
        delivered.push_back(b.size());
    });

    for (int i = 0; i < 5; ++i) {
        EXPECT_NO_THROW(acc.add(makeRecord(i)));
    }
    EXPECT_NO_THROW(acc.drain());

    // 3 flushes for 5 records; the first batch is lost, never re-sent.
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delivered, (std::vector<std::size_t>{2, 1}));

    const auto stats = acc.stats();
    EXPECT_EQ(stats.failedFlushes, 1);
    EXPECT_EQ(stats.batchesFlushed, 2);
    EXPECT_EQ(stats.recordsFlushed, 3);
}

TEST(BatchAccumulator, PropagatePolicyRethrowsAfterDiscardingBatch) {
    int calls = 0;
    BatchAccumulator acc(2, [&](const Batch&) {
        ++calls;
        throw std::runtime_error("disk full");
    }, FlushFailurePolicy::Propagate);

    acc.add(makeRecord(0));
    EXPECT_THROW(acc.add(makeRecord(1)), std::runtime_error);
    EXPECT_EQ(acc.pending(), 0u);

    acc.drain();   // nothing left, so no second attempt
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(acc.stats().failedFlushes, 1);
}
