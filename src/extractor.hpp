#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Per-source capability that turns page numbers and record links into data.
///
/// Error contract:
///   - TransportError / ExtractionError from listPage(): the page counts as
///     empty for that run.
///   - TransportError / ExtractionError from fetchRecord(), or std::nullopt:
///     the link is skipped.
///   - SessionError from any method: the crawl aborts.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual std::string sourceId()   const = 0;
    virtual std::string sourceName() const = 0;

    /// Establish whatever the source needs before the first page
    /// (cookies, access token).  Default: nothing.
    virtual void openSession() {}

    /// Ordered record links found on listing page @p pageNumber.
    virtual std::vector<std::string> listPage(int pageNumber) = 0;

    /// Fetch and parse one record.  The returned record carries a natural key.
    virtual std::optional<CrawlRecord> fetchRecord(const std::string& link) = 0;
};

} // namespace shop_harvest
