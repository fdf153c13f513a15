#pragma once

#include "document_store.hpp"
#include "models.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Run history: one document per run id.
class HistorySink {
public:
    virtual ~HistorySink() = default;

    /// @throws PersistenceError, including when the stored document for
    ///         this run id already reached a terminal status.
    virtual void save(const CrawlRunResult& result) = 0;
};

/// History as documents of the "run_history" collection keyed by run id.
class DocumentHistoryStore : public HistorySink {
public:
    static constexpr const char* kCollection = "run_history";

    explicit DocumentHistoryStore(DocumentStore& store);

    void save(const CrawlRunResult& result) override;

    std::optional<CrawlRunResult> get(const std::string& runId) const;

    /// Runs of @p sourceId, newest first, at most @p limit.
    std::vector<CrawlRunResult> listBySource(const std::string& sourceId,
                                             std::size_t limit = 100) const;

private:
    DocumentStore& mStore;
};

} // namespace shop_harvest
