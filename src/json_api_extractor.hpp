#pragma once

#include "extractor.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Where things live in a source's JSON listing and detail documents.
/// Every "pointer" is an RFC 6901 JSON pointer; "" addresses the whole document.
struct JsonApiLayout {
    std::string sourceId;
    std::string sourceName;

    std::string listUrl;                 // contains "{page}"
    std::string linksPointer = "/items";
    std::string linkField    = "url";    // used when link entries are objects
    std::string baseUrl;                 // relative links resolve against this

    std::string recordPointer;
    std::map<std::string, std::string> fields;   // "name" and "address" are required

    std::string tokenUrl;                // empty: no session
    std::string tokenPointer = "/token";
};

/// Extractor for sources that publish a paginated JSON listing of detail
/// links and one JSON document per record.
class JsonApiExtractor : public Extractor {
public:
    /// @throws ConfigError on an invalid layout.
    JsonApiExtractor(HttpClient& http, JsonApiLayout layout);

    std::string sourceId()   const override { return mLayout.sourceId; }
    std::string sourceName() const override { return mLayout.sourceName; }

    /// Fetches the access token when the layout names a token URL.
    /// @throws SessionError.
    void openSession() override;

    std::vector<std::string> listPage(int pageNumber) override;

    std::optional<CrawlRecord> fetchRecord(const std::string& link) override;

    const JsonApiLayout& layout() const { return mLayout; }

private:
    HttpClient&   mHttp;
    JsonApiLayout mLayout;
    std::string   mToken;

    HttpClient::Headers requestHeaders() const;
};

/// Links listed in @p page, in document order, resolved against @p baseUrl.
/// Entries are strings or objects carrying @p linkField; others are skipped.
/// @throws ExtractionError if @p pointer does not address an array.
std::vector<std::string> extractLinks(const nlohmann::json& page,
                                      const std::string& pointer,
                                      const std::string& linkField,
                                      const std::string& baseUrl);

/// Build a record from a detail document.  "name" and "address" map to the
/// record's own members, every other field lands in CrawlRecord::fields;
/// fields whose pointer resolves to nothing are left out.
/// @throws ExtractionError if the record has no name.
CrawlRecord mapRecord(const nlohmann::json& doc,
                      const std::string& sourceId,
                      const std::string& link,
                      const std::map<std::string, std::string>& fields);

} // namespace shop_harvest
