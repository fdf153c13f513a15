#include "record_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mapping.hpp"

namespace shop_harvest {

namespace {

constexpr const char* kTag = "RecordStore";

} // namespace

std::string validateRecord(const CrawlRecord& record) {
    if (record.naturalKey.empty()) return "natural key is required";
    if (record.sourceId.empty())   return "source id is required";
    if (record.name.empty())       return "name is required";
    if (record.naturalKey.rfind(record.sourceId + "_", 0) != 0) {
        return "natural key '" + record.naturalKey + "' does not start with '" +
               record.sourceId + "_'";
    }
    return {};
}

DocumentRecordStore::DocumentRecordStore(DocumentStore& store)
    : mStore(store) {}

UpsertResult DocumentRecordStore::upsertBatch(const Batch& records) {
    UpsertResult result;
    if (records.empty()) {
        return result;
    }

    const std::string now = formatIsoTime(Clock::now());

    try {
        for (const auto& record : records) {
            const auto problem = validateRecord(record);
            if (!problem.empty()) {
                ++result.skipped;
                SH_LOG_WARN(kTag, "Skipping invalid record " << record.naturalKey
                            << ": " << problem);
                continue;
            }

            auto doc = recordToJson(record);
            doc["updated_at"] = now;

            const bool exists = mStore.contains(kCollection, record.naturalKey);
            mStore.put(kCollection, record.naturalKey, doc, /*merge=*/exists);
            if (exists) {
                ++result.updated;
            } else {
                ++result.created;
            }
        }
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Failed to upsert batch: ") + e.what());
    }

    SH_LOG_INFO(kTag, "Upserted batch: " << result.created << " created, "
                << result.updated << " updated, " << result.skipped << " skipped");
    return result;
}

std::optional<CrawlRecord> DocumentRecordStore::get(const std::string& naturalKey) const {
    auto doc = mStore.get(kCollection, naturalKey);
    if (!doc) return std::nullopt;
    return recordFromJson(*doc);
}

std::vector<std::string> DocumentRecordStore::keysForSource(const std::string& sourceId) const {
    std::vector<std::string> keys;
    for (const auto& id : mStore.list(kCollection)) {
        auto doc = mStore.get(kCollection, id);
        if (doc && doc->value("source_id", "") == sourceId) {
            keys.push_back(id);
        }
    }
    return keys;
}

} // namespace shop_harvest
