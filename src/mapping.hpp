#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

namespace shop_harvest {

/// Stored document shape of a record.  Optional fields map to null.
nlohmann::json recordToJson(const CrawlRecord& record);

/// Throws std::runtime_error if "natural_key" is missing.
CrawlRecord recordFromJson(const nlohmann::json& doc);

nlohmann::json checkpointToJson(const CrawlCheckpoint& checkpoint);

/// Missing fields default; "completed_pages" is de-duplicated.
CrawlCheckpoint checkpointFromJson(const nlohmann::json& doc);

nlohmann::json runResultToJson(const CrawlRunResult& result);

/// Throws std::runtime_error if "run_id" is missing.
CrawlRunResult runResultFromJson(const nlohmann::json& doc);

} // namespace shop_harvest
