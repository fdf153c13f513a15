#include "mapping.hpp"

#include <algorithm>
#include <stdexcept>

namespace shop_harvest {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalTimeToJson(const std::optional<TimePoint>& value) {
    return value ? nlohmann::json(formatIsoTime(*value)) : nlohmann::json(nullptr);
}

std::optional<double> optionalDouble(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_number()) return std::nullopt;
    return doc[key].get<double>();
}

std::optional<TimePoint> optionalTime(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_string()) return std::nullopt;
    return parseIsoTime(doc[key].get<std::string>());
}

TimePoint timeOr(const nlohmann::json& doc, const char* key, TimePoint fallback) {
    return optionalTime(doc, key).value_or(fallback);
}

} // namespace

// ---------------------------------------------------------------------------
// CrawlRecord
// ---------------------------------------------------------------------------

nlohmann::json recordToJson(const CrawlRecord& record) {
    return {
        {"natural_key", record.naturalKey},
        {"source_id",   record.sourceId},
        {"link",        record.link},
        {"name",        record.name},
        {"address",     record.address},
        {"fields",      record.fields},
        {"latitude",    optionalToJson(record.latitude)},
        {"longitude",   optionalToJson(record.longitude)},
        {"geocoded_at", optionalTimeToJson(record.geocodedAt)},
        {"scraped_at",  formatIsoTime(record.scrapedAt)},
    };
}

CrawlRecord recordFromJson(const nlohmann::json& doc) {
    if (!doc.contains("natural_key") || !doc["natural_key"].is_string()) {
        throw std::runtime_error("Record document missing 'natural_key'");
    }

    CrawlRecord r;
    r.naturalKey = doc["natural_key"].get<std::string>();
    r.sourceId   = doc.value("source_id", "");
    r.link       = doc.value("link", "");
    r.name       = doc.value("name", "");
    r.address    = doc.value("address", "");
    if (doc.contains("fields") && doc["fields"].is_object()) {
        r.fields = doc["fields"];
    }
    r.latitude   = optionalDouble(doc, "latitude");
    r.longitude  = optionalDouble(doc, "longitude");
    r.geocodedAt = optionalTime(doc, "geocoded_at");
    r.scrapedAt  = timeOr(doc, "scraped_at", r.scrapedAt);
    return r;
}

// ---------------------------------------------------------------------------
// CrawlCheckpoint
// ---------------------------------------------------------------------------

nlohmann::json checkpointToJson(const CrawlCheckpoint& checkpoint) {
    return {
        {"source_id",       checkpoint.sourceId},
        {"completed_pages", checkpoint.completedPages},
        {"total_saved",     checkpoint.totalSaved},
        {"last_record_id",  checkpoint.lastRecordId},
        {"updated_at",      formatIsoTime(checkpoint.updatedAt)},
    };
}

CrawlCheckpoint checkpointFromJson(const nlohmann::json& doc) {
    CrawlCheckpoint cp;
    cp.sourceId     = doc.value("source_id", "");
    cp.totalSaved   = doc.value("total_saved", 0);
    cp.lastRecordId = doc.value("last_record_id", "");
    cp.updatedAt    = timeOr(doc, "updated_at", cp.updatedAt);

    if (doc.contains("completed_pages") && doc["completed_pages"].is_array()) {
        for (const auto& page : doc["completed_pages"]) {
            const int p = page.get<int>();
            if (std::find(cp.completedPages.begin(), cp.completedPages.end(), p) ==
                cp.completedPages.end()) {
                cp.completedPages.push_back(p);
            }
        }
    }
    return cp;
}

// ---------------------------------------------------------------------------
// CrawlRunResult
// ---------------------------------------------------------------------------

nlohmann::json runResultToJson(const CrawlRunResult& result) {
    return {
        {"run_id",             result.runId},
        {"source_id",          result.sourceId},
        {"source_name",        result.sourceName},
        {"started_at",         formatIsoTime(result.startedAt)},
        {"completed_at",       optionalTimeToJson(result.completedAt)},
        {"duration_seconds",   optionalToJson(result.durationSeconds)},
        {"status",             toString(result.status)},
        {"total_records",      result.totalRecords},
        {"new_records",        result.newRecords},
        {"updated_records",    result.updatedRecords},
        {"geocoded_records",   result.geocodedRecords},
        {"geocoding_failures", result.geocodingFailures},
        {"failed_batches",     result.failedBatches},
        {"pages_completed",    result.pagesCompleted},
        {"errors",             result.errors},
    };
}

CrawlRunResult runResultFromJson(const nlohmann::json& doc) {
    if (!doc.contains("run_id") || !doc["run_id"].is_string()) {
        throw std::runtime_error("Run history document missing 'run_id'");
    }

    CrawlRunResult r;
    r.runId             = doc["run_id"].get<std::string>();
    r.sourceId          = doc.value("source_id", "");
    r.sourceName        = doc.value("source_name", "");
    r.startedAt         = timeOr(doc, "started_at", r.startedAt);
    r.completedAt       = optionalTime(doc, "completed_at");
    r.durationSeconds   = optionalDouble(doc, "duration_seconds");
    r.status            = parseRunStatus(doc.value("status", "pending"));
    r.totalRecords      = doc.value("total_records", 0);
    r.newRecords        = doc.value("new_records", 0);
    r.updatedRecords    = doc.value("updated_records", 0);
    r.geocodedRecords   = doc.value("geocoded_records", 0);
    r.geocodingFailures = doc.value("geocoding_failures", 0);
    r.failedBatches     = doc.value("failed_batches", 0);
    r.pagesCompleted    = doc.value("pages_completed", 0);
    if (doc.contains("errors") && doc["errors"].is_array()) {
        r.errors = doc["errors"].get<std::vector<std::string>>();
    }
    return r;
}

} // namespace shop_harvest
