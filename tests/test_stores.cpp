/// @file test_stores.cpp
/// Unit tests for the document store and the checkpoint, record and history
/// stores layered on it.

#include "checkpoint_store.hpp"
#include "document_store.hpp"
#include "errors.hpp"
#include "history_store.hpp"
#include "record_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace shop_harvest;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        mPath = fs::temp_directory_path() /
                ("shop_harvest_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(mPath);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(mPath, ec);
    }
    const fs::path& path() const { return mPath; }

private:
    fs::path mPath;
};

CrawlRecord makeRecord(const std::string& link, const std::string& name) {
    CrawlRecord r;
    r.sourceId   = "08";
    r.link       = link;
    r.naturalKey = makeNaturalKey("08", link);
    r.name       = name;
    r.address    = "Mito " + name;
    return r;
}

CrawlRunResult makeRun(const std::string& runId, const std::string& startedAt,
                       RunStatus status) {
    CrawlRunResult r;
    r.runId     = runId;
    r.sourceId  = "08";
    r.startedAt = parseIsoTime(startedAt);
    r.status    = status;
    return r;
}

} // namespace

// ============================================================================
// DocumentStore
// ============================================================================

TEST(InMemoryDocumentStore, PutGetRemove) {
    InMemoryDocumentStore store;
    EXPECT_FALSE(store.get("c", "a").has_value());

    store.put("c", "a", {{"x", 1}});
    ASSERT_TRUE(store.get("c", "a").has_value());
    EXPECT_EQ((*store.get("c", "a"))["x"], 1);
    EXPECT_TRUE(store.contains("c", "a"));

    store.remove("c", "a");
    store.remove("c", "a");
    EXPECT_FALSE(store.contains("c", "a"));
}

TEST(InMemoryDocumentStore, MergeKeepsUntouchedKeys) {
    InMemoryDocumentStore store;
    store.put("c", "a", {{"x", 1}, {"y", 2}});
    store.put("c", "a", {{"y", 3}, {"z", 4}}, /*merge=*/true);

    const auto doc = *store.get("c", "a");
    EXPECT_EQ(doc["x"], 1);
    EXPECT_EQ(doc["y"], 3);
    EXPECT_EQ(doc["z"], 4);
}

TEST(InMemoryDocumentStore, ListIsSorted) {
    InMemoryDocumentStore store;
    store.put("c", "b", json::object());
    store.put("c", "a", json::object());
    store.put("other", "z", json::object());
    EXPECT_EQ(store.list("c"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(store.list("missing").empty());
}

TEST(DocumentNames, PathLikeNamesAreRejected) {
    EXPECT_THROW(validateDocumentName(""), PersistenceError);
    EXPECT_THROW(validateDocumentName(".."), PersistenceError);
    EXPECT_THROW(validateDocumentName("a/b"), PersistenceError);
    EXPECT_THROW(validateDocumentName("a\\b"), PersistenceError);
    EXPECT_NO_THROW(validateDocumentName("08_a3b5c7d9"));

    InMemoryDocumentStore store;
    EXPECT_THROW(store.put("records", "../escape", json::object()), PersistenceError);
}

TEST(JsonFileDocumentStore, DocumentsPersistAcrossInstances) {
    TempDir dir;
    {
        JsonFileDocumentStore store(dir.path());
        store.put("records", "08_1", {{"name", "Cafe"}});
    }
    EXPECT_TRUE(fs::exists(dir.path() / "records" / "08_1.json"));

    JsonFileDocumentStore reopened(dir.path());
    ASSERT_TRUE(reopened.get("records", "08_1").has_value());
    EXPECT_EQ((*reopened.get("records", "08_1"))["name"], "Cafe");
    EXPECT_EQ(reopened.list("records"), (std::vector<std::string>{"08_1"}));
}

TEST(JsonFileDocumentStore, MergeAndRemove) {
    TempDir dir;
    JsonFileDocumentStore store(dir.path());
    store.put("c", "a", {{"x", 1}});
    store.put("c", "a", {{"y", 2}}, /*merge=*/true);
    EXPECT_EQ(*store.get("c", "a"), (json{{"x", 1}, {"y", 2}}));

    store.remove("c", "a");
    EXPECT_FALSE(store.get("c", "a").has_value());
    EXPECT_NO_THROW(store.remove("c", "a"));
}

TEST(JsonFileDocumentStore, InvalidUtf8IsReplacedOnWrite) {
    TempDir dir;
    JsonFileDocumentStore store(dir.path());
    store.put("c", "a", {{"error", std::string("last read: '\x82\xa0'")}});

    const auto doc = store.get("c", "a");
    ASSERT_TRUE(doc.has_value());
    const auto text = (*doc)["error"].get<std::string>();
    EXPECT_EQ(text.rfind("last read: '", 0), 0u);
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(JsonFileDocumentStore, CorruptDocumentThrows) {
    TempDir dir;
    JsonFileDocumentStore store(dir.path());
    fs::create_directories(dir.path() / "c");
    std::ofstream(dir.path() / "c" / "bad.json") << "{ not json";

    EXPECT_THROW(store.get("c", "bad"), PersistenceError);
}

TEST(JsonFileDocumentStore, TemporaryFilesAreNotListed) {
    TempDir dir;
    JsonFileDocumentStore store(dir.path());
    store.put("c", "a", json::object());
    std::ofstream(dir.path() / "c" / "b.json.tmp") << "{}";

    EXPECT_EQ(store.list("c"), (std::vector<std::string>{"a"}));
}

// ============================================================================
// CheckpointStore
// ============================================================================

TEST(DocumentCheckpointStore, SaveGetClear) {
    InMemoryDocumentStore docs;
    DocumentCheckpointStore store(docs);

    EXPECT_FALSE(store.get("08").has_value());

    store.save("08", {3, 1, 2, 2}, 60, "08_00060");
    const auto cp = store.get("08");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->sourceId, "08");
    EXPECT_EQ(cp->completedPages, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(cp->totalSaved, 60);
    EXPECT_EQ(cp->lastRecordId, "08_00060");
    EXPECT_EQ(cp->resumePage(), 4);

    store.clear("08");
    EXPECT_FALSE(store.get("08").has_value());
    EXPECT_FALSE(docs.contains(DocumentCheckpointStore::kCollection, "08"));
}

TEST(DocumentCheckpointStore, SaveOverwrites) {
    InMemoryDocumentStore docs;
    DocumentCheckpointStore store(docs);
    store.save("08", {1}, 20, "a");
    store.save("08", {1, 2}, 40, "b");

    const auto cp = store.get("08");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->completedPages, (std::vector<int>{1, 2}));
    EXPECT_EQ(cp->totalSaved, 40);
}

TEST(DocumentCheckpointStore, UnreadableCheckpointIsTreatedAsAbsent) {
    TempDir dir;
    JsonFileDocumentStore docs(dir.path());
    DocumentCheckpointStore store(docs);

    fs::create_directories(dir.path() / DocumentCheckpointStore::kCollection);
    std::ofstream(dir.path() / DocumentCheckpointStore::kCollection / "08.json") << "[[[";

    EXPECT_FALSE(store.get("08").has_value());
}

TEST(InMemoryCheckpointStore, BehavesLikeDocumentStore) {
    InMemoryCheckpointStore store;
    store.save("13", {5, 4}, 10, "13_00010");
    ASSERT_TRUE(store.get("13").has_value());
    EXPECT_EQ(store.get("13")->completedPages, (std::vector<int>{4, 5}));
    store.clear("13");
    EXPECT_FALSE(store.get("13").has_value());
}

TEST(UniquePages, SortsAndDeduplicates) {
    EXPECT_EQ(uniquePages({3, 1, 3, 2, 1}), (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(uniquePages({}).empty());
}

// ============================================================================
// RecordStore
// ============================================================================

TEST(DocumentRecordStore, SecondUpsertUpdatesInsteadOfDuplicating) {
    InMemoryDocumentStore docs;
    DocumentRecordStore store(docs);

    Batch batch = {makeRecord("https://x/1", "One"), makeRecord("https://x/2", "Two"),
                   makeRecord("https://x/3", "Three")};

    const auto first = store.upsertBatch(batch);
    EXPECT_EQ(first.created, 3);
    EXPECT_EQ(first.updated, 0);

    const auto second = store.upsertBatch(batch);
    EXPECT_EQ(second.created, 0);
    EXPECT_EQ(second.updated, 3);

    EXPECT_EQ(store.keysForSource("08").size(), 3u);
}

TEST(DocumentRecordStore, UpdateReplacesScrapedFields) {
    InMemoryDocumentStore docs;
    DocumentRecordStore store(docs);

    auto geocoded = makeRecord("https://x/1", "One");
    geocoded.latitude  = 36.3;
    geocoded.longitude = 140.4;
    store.upsertBatch({geocoded});

    auto rescraped = makeRecord("https://x/1", "One (renamed)");
    store.upsertBatch({rescraped});

    const auto stored = store.get(geocoded.naturalKey);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "One (renamed)");
    EXPECT_EQ(store.keysForSource("08").size(), 1u);
}

TEST(DocumentRecordStore, InvalidRecordsAreSkipped) {
    InMemoryDocumentStore docs;
    DocumentRecordStore store(docs);

    auto noName = makeRecord("https://x/1", "");
    auto badKey = makeRecord("https://x/2", "Two");
    badKey.naturalKey = "13_ffffffff";

    const auto result = store.upsertBatch({noName, badKey, makeRecord("https://x/3", "Ok")});
    EXPECT_EQ(result.created, 1);
    EXPECT_EQ(result.skipped, 2);
}

TEST(DocumentRecordStore, EmptyBatchWritesNothing) {
    InMemoryDocumentStore docs;
    DocumentRecordStore store(docs);
    const auto result = store.upsertBatch({});
    EXPECT_EQ(result.created + result.updated + result.skipped, 0);
    EXPECT_TRUE(docs.list(DocumentRecordStore::kCollection).empty());
}

TEST(RecordValidation, Reasons) {
    EXPECT_TRUE(validateRecord(makeRecord("https://x/1", "One")).empty());

    CrawlRecord r = makeRecord("https://x/1", "One");
    r.naturalKey.clear();
    EXPECT_FALSE(validateRecord(r).empty());
}

// ============================================================================
// HistoryStore
// ============================================================================

TEST(DocumentHistoryStore, RunningThenTerminal) {
    InMemoryDocumentStore docs;
    DocumentHistoryStore store(docs);

    auto run = makeRun("08_aaaaaaaa", "2026-05-01T00:00:00Z", RunStatus::Running);
    store.save(run);
    run.status       = RunStatus::Success;
    run.totalRecords = 42;
    store.save(run);

    const auto stored = store.get("08_aaaaaaaa");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, RunStatus::Success);
    EXPECT_EQ(stored->totalRecords, 42);
}

TEST(DocumentHistoryStore, TerminalDocumentIsNeverOverwritten) {
    InMemoryDocumentStore docs;
    DocumentHistoryStore store(docs);

    auto run = makeRun("08_bbbbbbbb", "2026-05-01T00:00:00Z", RunStatus::Failed);
    store.save(run);

    run.status = RunStatus::Success;
    EXPECT_THROW(store.save(run), PersistenceError);
    EXPECT_EQ(store.get("08_bbbbbbbb")->status, RunStatus::Failed);
}

TEST(DocumentHistoryStore, MissingRunIdThrows) {
    InMemoryDocumentStore docs;
    DocumentHistoryStore store(docs);
    EXPECT_THROW(store.save(CrawlRunResult{}), PersistenceError);
}

TEST(DocumentHistoryStore, ListBySourceIsNewestFirstAndLimited) {
    InMemoryDocumentStore docs;
    DocumentHistoryStore store(docs);

    store.save(makeRun("08_00000001", "2026-05-01T00:00:00Z", RunStatus::Success));
    store.save(makeRun("08_00000003", "2026-05-03T00:00:00Z", RunStatus::Partial));
    store.save(makeRun("08_00000002", "2026-05-02T00:00:00Z", RunStatus::Failed));

    auto other = makeRun("13_00000009", "2026-05-09T00:00:00Z", RunStatus::Success);
    other.sourceId = "13";
    store.save(other);

    const auto runs = store.listBySource("08");
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].runId, "08_00000003");
    EXPECT_EQ(runs[1].runId, "08_00000002");
    EXPECT_EQ(runs[2].runId, "08_00000001");

    EXPECT_EQ(store.listBySource("08", 1).size(), 1u);
    EXPECT_TRUE(store.listBySource("99").empty());
}
