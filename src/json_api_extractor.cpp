#include "json_api_extractor.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <utility>

using json = nlohmann::json;

namespace shop_harvest {

namespace {

constexpr const char* kTag = "JsonApiExtractor";

/// nullptr when @p pointer does not resolve.
const json* resolvePointer(const json& doc, const std::string& pointer) {
    if (pointer.empty()) {
        return &doc;
    }
    const json::json_pointer ptr(pointer);
    if (!doc.contains(ptr)) {
        return nullptr;
    }
    return &doc.at(ptr);
}

std::string asText(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

void checkPointer(const std::string& what, const std::string& pointer) {
    if (pointer.empty()) {
        return;
    }
    try {
        json::json_pointer ptr(pointer);
        (void)ptr;
    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON pointer for " + what + " '" + pointer + "': " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

std::vector<std::string> extractLinks(const json& page,
                                      const std::string& pointer,
                                      const std::string& linkField,
                                      const std::string& baseUrl) {
    const json* node = nullptr;
    try {
        node = resolvePointer(page, pointer);
    } catch (const json::exception& e) {
        throw ExtractionError("Cannot resolve links at '" + pointer + "': " + e.what());
    }
    if (node == nullptr || !node->is_array()) {
        throw ExtractionError("No link array at '" + pointer + "'");
    }

    std::vector<std::string> links;
    links.reserve(node->size());
    for (const auto& entry : *node) {
        std::string href;
        if (entry.is_string()) {
            href = entry.get<std::string>();
        } else if (entry.is_object() && !linkField.empty() && entry.contains(linkField) &&
                   entry[linkField].is_string()) {
            href = entry[linkField].get<std::string>();
        }

        href = trim(href);
        if (href.empty()) {
            continue;
        }
        links.push_back(baseUrl.empty() ? href : resolveUrl(baseUrl, href));
    }
    return links;
}

CrawlRecord mapRecord(const json& doc,
                      const std::string& sourceId,
                      const std::string& link,
                      const std::map<std::string, std::string>& fields) {
    CrawlRecord record;
    record.sourceId   = sourceId;
    record.link       = link;
    record.naturalKey = makeNaturalKey(sourceId, link);

    for (const auto& [name, pointer] : fields) {
        const json* value = nullptr;
        try {
            value = resolvePointer(doc, pointer);
        } catch (const json::exception& e) {
            throw ExtractionError("Cannot resolve field '" + name + "': " + e.what());
        }
        if (value == nullptr) {
            continue;
        }

        if (name == "name") {
            record.name = trim(asText(*value));
        } else if (name == "address") {
            record.address = trim(asText(*value));
        } else {
            record.fields[name] = *value;
        }
    }

    if (record.name.empty()) {
        throw ExtractionError("Record at " + link + " has no name");
    }
    return record;
}

// ---------------------------------------------------------------------------
// JsonApiExtractor
// ---------------------------------------------------------------------------

JsonApiExtractor::JsonApiExtractor(HttpClient& http, JsonApiLayout layout)
    : mHttp(http)
    , mLayout(std::move(layout))
{
    if (mLayout.sourceId.empty()) {
        throw ConfigError("Source id is required");
    }
    if (mLayout.listUrl.find("{page}") == std::string::npos) {
        throw ConfigError("list_url of source " + mLayout.sourceId + " lacks {page}");
    }
    if (mLayout.fields.count("name") == 0) {
        throw ConfigError("Source " + mLayout.sourceId + " does not map a name field");
    }
    if (mLayout.fields.count("address") == 0) {
        throw ConfigError("Source " + mLayout.sourceId + " does not map an address field");
    }

    checkPointer("links_pointer", mLayout.linksPointer);
    checkPointer("record_pointer", mLayout.recordPointer);
    checkPointer("session.token_pointer", mLayout.tokenPointer);
    for (const auto& entry : mLayout.fields) {
        checkPointer("field " + entry.first, entry.second);
    }
}

void JsonApiExtractor::openSession() {
    if (mLayout.tokenUrl.empty()) {
        return;
    }

    json body;
    try {
        body = mHttp.getJson(mLayout.tokenUrl);
    } catch (const HarvestError& e) {
        throw SessionError("Failed to obtain access token for " + mLayout.sourceId + ": " +
                           e.what());
    }

    const json* token = resolvePointer(body, mLayout.tokenPointer);
    if (token == nullptr || !token->is_string() || token->get<std::string>().empty()) {
        throw SessionError("Token response of " + mLayout.sourceId + " has no token at '" +
                           mLayout.tokenPointer + "'");
    }
    mToken = token->get<std::string>();
    SH_LOG_INFO(kTag, "Session opened for " << mLayout.sourceId);
}

HttpClient::Headers JsonApiExtractor::requestHeaders() const {
    HttpClient::Headers headers{{"Accept", "application/json"}};
    if (!mToken.empty()) {
        headers["Authorization"] = "Bearer " + mToken;
    }
    return headers;
}

std::vector<std::string> JsonApiExtractor::listPage(int pageNumber) {
    const auto url  = expandPageTemplate(mLayout.listUrl, pageNumber);
    const auto body = mHttp.getJson(url, requestHeaders());
    auto links = extractLinks(body, mLayout.linksPointer, mLayout.linkField, mLayout.baseUrl);
    SH_LOG_DEBUG(kTag, "Page " << pageNumber << " of " << mLayout.sourceId << ": "
                 << links.size() << " links");
    return links;
}

std::optional<CrawlRecord> JsonApiExtractor::fetchRecord(const std::string& link) {
    const auto body = mHttp.getJson(link, requestHeaders());

    const json* doc = nullptr;
    try {
        doc = resolvePointer(body, mLayout.recordPointer);
    } catch (const json::exception& e) {
        throw ExtractionError("Cannot resolve record at " + link + ": " + e.what());
    }
    if (doc == nullptr || !doc->is_object()) {
        SH_LOG_WARN(kTag, "No record object at " << link);
        return std::nullopt;
    }
    return mapRecord(*doc, mLayout.sourceId, link, mLayout.fields);
}

} // namespace shop_harvest
