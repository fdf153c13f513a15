#pragma once

#include "document_store.hpp"
#include "models.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Durable record of crawl progress, one checkpoint per source.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    virtual std::optional<CrawlCheckpoint> get(const std::string& sourceId) = 0;

    /// Create or overwrite the checkpoint of @p sourceId.
    /// @throws PersistenceError.
    virtual void save(const std::string& sourceId,
                      const std::vector<int>& completedPages,
                      int totalSaved,
                      const std::string& lastRecordId) = 0;

    /// @throws PersistenceError.
    virtual void clear(const std::string& sourceId) = 0;
};

class InMemoryCheckpointStore : public CheckpointStore {
public:
    std::optional<CrawlCheckpoint> get(const std::string& sourceId) override;
    void save(const std::string& sourceId, const std::vector<int>& completedPages,
              int totalSaved, const std::string& lastRecordId) override;
    void clear(const std::string& sourceId) override;

private:
    std::mutex                             mMutex;
    std::map<std::string, CrawlCheckpoint> mCheckpoints;
};

/// Checkpoints as documents of the "crawl_progress" collection keyed by
/// source id.  A checkpoint that cannot be read is reported as absent, so a
/// damaged checkpoint costs a full re-crawl rather than a failed run.
class DocumentCheckpointStore : public CheckpointStore {
public:
    static constexpr const char* kCollection = "crawl_progress";

    explicit DocumentCheckpointStore(DocumentStore& store);

    std::optional<CrawlCheckpoint> get(const std::string& sourceId) override;
    void save(const std::string& sourceId, const std::vector<int>& completedPages,
              int totalSaved, const std::string& lastRecordId) override;
    void clear(const std::string& sourceId) override;

private:
    DocumentStore& mStore;
};

/// Sorted copy of @p pages with duplicates removed.
std::vector<int> uniquePages(std::vector<int> pages);

} // namespace shop_harvest
