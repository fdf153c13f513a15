#include "history_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mapping.hpp"

#include <algorithm>

namespace shop_harvest {

DocumentHistoryStore::DocumentHistoryStore(DocumentStore& store)
    : mStore(store) {}

void DocumentHistoryStore::save(const CrawlRunResult& result) {
    if (result.runId.empty()) {
        throw PersistenceError("Cannot save run history without a run id");
    }

    if (auto existing = mStore.get(kCollection, result.runId)) {
        const auto status = existing->value("status", "pending");
        if (isTerminal(parseRunStatus(status))) {
            throw PersistenceError("Run " + result.runId + " already recorded as " + status);
        }
    }

    mStore.put(kCollection, result.runId, runResultToJson(result));
    SH_LOG_INFO("HistoryStore", "Saved run " << result.runId << " (" << result.sourceId
                << ", " << toString(result.status) << ")");
}

std::optional<CrawlRunResult> DocumentHistoryStore::get(const std::string& runId) const {
    auto doc = mStore.get(kCollection, runId);
    if (!doc) return std::nullopt;
    return runResultFromJson(*doc);
}

std::vector<CrawlRunResult>
DocumentHistoryStore::listBySource(const std::string& sourceId, std::size_t limit) const {
    std::vector<CrawlRunResult> runs;
    for (const auto& id : mStore.list(kCollection)) {
        auto doc = mStore.get(kCollection, id);
        if (doc && doc->value("source_id", "") == sourceId) {
            runs.push_back(runResultFromJson(*doc));
        }
    }

    std::sort(runs.begin(), runs.end(), [](const CrawlRunResult& a, const CrawlRunResult& b) {
        return a.startedAt > b.startedAt;
    });
    if (runs.size() > limit) {
        runs.resize(limit);
    }
    return runs;
}

} // namespace shop_harvest
