#pragma once

#include "util.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// A parsed listing awaiting enrichment and persistence.
struct CrawlRecord {
    std::string naturalKey;   // e.g. "08_a3b5c7d9", stable across runs
    std::string sourceId;
    std::string link;         // canonical detail link
    std::string name;
    std::string address;
    nlohmann::json fields = nlohmann::json::object();   // source-specific extras

    std::optional<double>    latitude;
    std::optional<double>    longitude;
    std::optional<TimePoint> geocodedAt;
    TimePoint                scrapedAt = Clock::now();

    bool hasCoordinates() const { return latitude.has_value() && longitude.has_value(); }
};

using Batch = std::vector<CrawlRecord>;

/// Durable crawl progress for one source.
struct CrawlCheckpoint {
    std::string      sourceId;
    std::vector<int> completedPages;   // unique, order irrelevant
    int              totalSaved = 0;
    std::string      lastRecordId;
    TimePoint        updatedAt = Clock::now();

    /// max(completedPages) + 1, or @p firstPage when nothing completed.
    int resumePage(int firstPage = 1) const;
};

enum class RunStatus {
    Pending,
    Running,
    Success,
    Partial,
    Failed,
};

const char* toString(RunStatus status);

/// Throws std::invalid_argument for unknown text.
RunStatus parseRunStatus(const std::string& text);

inline bool isTerminal(RunStatus status) {
    return status == RunStatus::Success || status == RunStatus::Partial ||
           status == RunStatus::Failed;
}

/// Summary of one ingestion run, persisted once per terminal state.
struct CrawlRunResult {
    std::string              runId;
    std::string              sourceId;
    std::string              sourceName;
    TimePoint                startedAt = Clock::now();
    std::optional<TimePoint> completedAt;
    std::optional<double>    durationSeconds;
    RunStatus                status = RunStatus::Pending;

    int totalRecords      = 0;
    int newRecords        = 0;
    int updatedRecords    = 0;
    int geocodedRecords   = 0;
    int geocodingFailures = 0;
    int failedBatches     = 0;
    int pagesCompleted    = 0;

    std::vector<std::string> errors;
};

/// Geographic coordinates returned by a Geocoder.
struct GeoLocation {
    double                     latitude  = 0.0;
    double                     longitude = 0.0;
    std::optional<std::string> formattedAddress;
    std::optional<std::string> placeId;
};

} // namespace shop_harvest
