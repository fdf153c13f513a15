#include "document_store.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace shop_harvest {

namespace {

void mergeInto(nlohmann::json& target, const nlohmann::json& patch) {
    if (!target.is_object() || !patch.is_object()) {
        target = patch;
        return;
    }
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        target[it.key()] = it.value();
    }
}

} // namespace

void validateDocumentName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of("/\\") != std::string::npos ||
        name.find('\0') != std::string::npos) {
        throw PersistenceError("Invalid document name: '" + name + "'");
    }
}

// ---------------------------------------------------------------------------
// InMemoryDocumentStore
// ---------------------------------------------------------------------------

std::optional<nlohmann::json>
InMemoryDocumentStore::get(const std::string& collection, const std::string& id) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto coll = mCollections.find(collection);
    if (coll == mCollections.end()) return std::nullopt;
    auto doc = coll->second.find(id);
    if (doc == coll->second.end()) return std::nullopt;
    return doc->second;
}

void InMemoryDocumentStore::put(const std::string& collection, const std::string& id,
                                const nlohmann::json& doc, bool merge) {
    validateDocumentName(collection);
    validateDocumentName(id);

    std::lock_guard<std::mutex> lock(mMutex);
    auto& slot = mCollections[collection][id];
    if (merge && !slot.is_null()) {
        mergeInto(slot, doc);
    } else {
        slot = doc;
    }
}

void InMemoryDocumentStore::remove(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto coll = mCollections.find(collection);
    if (coll != mCollections.end()) {
        coll->second.erase(id);
    }
}

std::vector<std::string> InMemoryDocumentStore::list(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> ids;
    auto coll = mCollections.find(collection);
    if (coll != mCollections.end()) {
        for (const auto& entry : coll->second) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

// ---------------------------------------------------------------------------
// JsonFileDocumentStore
// ---------------------------------------------------------------------------

JsonFileDocumentStore::JsonFileDocumentStore(fs::path root)
    : mRoot(std::move(root))
{
    std::error_code ec;
    fs::create_directories(mRoot, ec);
    if (ec) {
        throw PersistenceError("Cannot create store directory " + mRoot.string() +
                               ": " + ec.message());
    }
    SH_LOG_DEBUG("DocumentStore", "Using " << mRoot.string());
}

fs::path JsonFileDocumentStore::pathFor(const std::string& collection,
                                        const std::string& id) const {
    validateDocumentName(collection);
    validateDocumentName(id);
    return mRoot / collection / (id + ".json");
}

std::optional<nlohmann::json> JsonFileDocumentStore::readFile(const fs::path& path) const {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("Corrupt document " + path.string() + ": " + e.what());
    }
}

std::optional<nlohmann::json>
JsonFileDocumentStore::get(const std::string& collection, const std::string& id) const {
    const auto path = pathFor(collection, id);
    std::lock_guard<std::mutex> lock(mMutex);
    return readFile(path);
}

void JsonFileDocumentStore::put(const std::string& collection, const std::string& id,
                                const nlohmann::json& doc, bool merge) {
    const auto path = pathFor(collection, id);
    std::lock_guard<std::mutex> lock(mMutex);

    nlohmann::json toWrite = doc;
    if (merge) {
        if (auto existing = readFile(path)) {
            mergeInto(*existing, doc);
            toWrite = std::move(*existing);
        }
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw PersistenceError("Cannot create " + path.parent_path().string() +
                               ": " + ec.message());
    }

    // Error text quoted from upstream pages may carry invalid UTF-8.
    std::string text;
    try {
        text = toWrite.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Cannot serialize " + collection + "/" + id + ": " + e.what());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot open " + tmp.string() + " for writing");
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            throw PersistenceError("Failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw PersistenceError("Cannot replace " + path.string());
    }
}

void JsonFileDocumentStore::remove(const std::string& collection, const std::string& id) {
    const auto path = pathFor(collection, id);
    std::lock_guard<std::mutex> lock(mMutex);

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw PersistenceError("Cannot remove " + path.string() + ": " + ec.message());
    }
}

std::vector<std::string> JsonFileDocumentStore::list(const std::string& collection) const {
    validateDocumentName(collection);
    const auto dir = mRoot / collection;

    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> ids;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return ids;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            ids.push_back(entry.path().stem().string());
        }
    }
    if (ec) {
        throw PersistenceError("Cannot list " + dir.string() + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace shop_harvest
