#include "checkpoint_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mapping.hpp"

#include <algorithm>

namespace shop_harvest {

namespace {

constexpr const char* kTag = "CheckpointStore";

CrawlCheckpoint makeCheckpoint(const std::string& sourceId,
                               const std::vector<int>& completedPages,
                               int totalSaved,
                               const std::string& lastRecordId) {
    CrawlCheckpoint cp;
    cp.sourceId       = sourceId;
    cp.completedPages = uniquePages(completedPages);
    cp.totalSaved     = totalSaved;
    cp.lastRecordId   = lastRecordId;
    cp.updatedAt      = Clock::now();
    return cp;
}

} // namespace

std::vector<int> uniquePages(std::vector<int> pages) {
    std::sort(pages.begin(), pages.end());
    pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
    return pages;
}

// ---------------------------------------------------------------------------
// InMemoryCheckpointStore
// ---------------------------------------------------------------------------

std::optional<CrawlCheckpoint> InMemoryCheckpointStore::get(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mCheckpoints.find(sourceId);
    if (it == mCheckpoints.end()) return std::nullopt;
    return it->second;
}

void InMemoryCheckpointStore::save(const std::string& sourceId,
                                   const std::vector<int>& completedPages,
                                   int totalSaved,
                                   const std::string& lastRecordId) {
    std::lock_guard<std::mutex> lock(mMutex);
    mCheckpoints[sourceId] = makeCheckpoint(sourceId, completedPages, totalSaved, lastRecordId);
}

void InMemoryCheckpointStore::clear(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(mMutex);
    mCheckpoints.erase(sourceId);
}

// ---------------------------------------------------------------------------
// DocumentCheckpointStore
// ---------------------------------------------------------------------------

DocumentCheckpointStore::DocumentCheckpointStore(DocumentStore& store)
    : mStore(store) {}

std::optional<CrawlCheckpoint> DocumentCheckpointStore::get(const std::string& sourceId) {
    try {
        auto doc = mStore.get(kCollection, sourceId);
        if (!doc) {
            SH_LOG_INFO(kTag, "No checkpoint for " << sourceId);
            return std::nullopt;
        }

        auto cp = checkpointFromJson(*doc);
        if (cp.sourceId.empty()) {
            cp.sourceId = sourceId;
        }
        SH_LOG_INFO(kTag, "Loaded checkpoint for " << sourceId << ": "
                    << cp.completedPages.size() << " pages, "
                    << cp.totalSaved << " records saved");
        return cp;

    } catch (const std::exception& e) {
        SH_LOG_ERROR(kTag, "Failed to read checkpoint for " << sourceId << ": " << e.what());
        return std::nullopt;
    }
}

void DocumentCheckpointStore::save(const std::string& sourceId,
                                   const std::vector<int>& completedPages,
                                   int totalSaved,
                                   const std::string& lastRecordId) {
    const auto cp = makeCheckpoint(sourceId, completedPages, totalSaved, lastRecordId);
    try {
        mStore.put(kCollection, sourceId, checkpointToJson(cp));
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError("Failed to save checkpoint for " + sourceId + ": " + e.what());
    }
    SH_LOG_DEBUG(kTag, "Saved checkpoint for " << sourceId << ": pages="
                 << cp.completedPages.size() << ", records=" << totalSaved);
}

void DocumentCheckpointStore::clear(const std::string& sourceId) {
    mStore.remove(kCollection, sourceId);
    SH_LOG_INFO(kTag, "Cleared checkpoint for " << sourceId);
}

} // namespace shop_harvest
