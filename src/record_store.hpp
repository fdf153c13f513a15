#pragma once

#include "document_store.hpp"
#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

struct UpsertResult {
    int created = 0;
    int updated = 0;
    int skipped = 0;   // failed validation, not written
};

/// Persistence sink for parsed records.  Keyed by natural key, so
/// re-submitting the same record updates instead of duplicating.
class RecordSink {
public:
    virtual ~RecordSink() = default;

    /// @throws PersistenceError.
    virtual UpsertResult upsertBatch(const Batch& records) = 0;
};

/// Records as documents of the "records" collection keyed by natural key.
/// Updates merge into the stored document.
class DocumentRecordStore : public RecordSink {
public:
    static constexpr const char* kCollection = "records";

    explicit DocumentRecordStore(DocumentStore& store);

    UpsertResult upsertBatch(const Batch& records) override;

    std::optional<CrawlRecord> get(const std::string& naturalKey) const;

    /// Natural keys of every stored record of @p sourceId.
    std::vector<std::string> keysForSource(const std::string& sourceId) const;

private:
    DocumentStore& mStore;
};

/// Empty string when @p record can be stored, otherwise the reason.
std::string validateRecord(const CrawlRecord& record);

} // namespace shop_harvest
