#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shop_harvest {

/// Minimal document database: JSON objects addressed by (collection, id).
/// All methods throw PersistenceError on storage failure.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& collection,
                                              const std::string& id) const = 0;

    /// Write a document.  With @p merge, top-level keys of @p doc are merged
    /// into an existing document instead of replacing it.
    virtual void put(const std::string& collection,
                     const std::string& id,
                     const nlohmann::json& doc,
                     bool merge = false) = 0;

    /// Removing a missing document is not an error.
    virtual void remove(const std::string& collection, const std::string& id) = 0;

    /// Ids in @p collection, sorted.
    virtual std::vector<std::string> list(const std::string& collection) const = 0;

    virtual bool contains(const std::string& collection, const std::string& id) const {
        return get(collection, id).has_value();
    }
};

/// Process-local store, used in tests and dry runs.
class InMemoryDocumentStore : public DocumentStore {
public:
    std::optional<nlohmann::json> get(const std::string& collection,
                                      const std::string& id) const override;
    void put(const std::string& collection, const std::string& id,
             const nlohmann::json& doc, bool merge = false) override;
    void remove(const std::string& collection, const std::string& id) override;
    std::vector<std::string> list(const std::string& collection) const override;

private:
    mutable std::mutex mMutex;
    std::map<std::string, std::map<std::string, nlohmann::json>> mCollections;
};

/// One pretty-printed JSON file per document:
///   <root>/<collection>/<id>.json
/// Writes go to a temporary file that is renamed over the target, so a
/// reader never observes a half-written document.
class JsonFileDocumentStore : public DocumentStore {
public:
    /// Creates @p root if needed.  @throws PersistenceError.
    explicit JsonFileDocumentStore(std::filesystem::path root);

    std::optional<nlohmann::json> get(const std::string& collection,
                                      const std::string& id) const override;
    void put(const std::string& collection, const std::string& id,
             const nlohmann::json& doc, bool merge = false) override;
    void remove(const std::string& collection, const std::string& id) override;
    std::vector<std::string> list(const std::string& collection) const override;

    const std::filesystem::path& root() const { return mRoot; }

private:
    std::filesystem::path mRoot;
    mutable std::mutex    mMutex;

    std::filesystem::path pathFor(const std::string& collection,
                                  const std::string& id) const;
    std::optional<nlohmann::json> readFile(const std::filesystem::path& path) const;
};

/// Reject ids and collection names that could escape the store root.
/// @throws PersistenceError.
void validateDocumentName(const std::string& name);

} // namespace shop_harvest
