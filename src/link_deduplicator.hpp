#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

namespace shop_harvest {

/// Run-scoped set of record links already handed downstream.
/// Cross-run duplicates are handled by the record store's natural-key upsert.
class LinkDeduplicator {
public:
    bool seen(const std::string& key) const { return mSeen.count(key) != 0; }

    void mark(const std::string& key) { mSeen.insert(key); }

    /// Mark @p key; true if it was not seen before.
    bool markIfNew(const std::string& key) { return mSeen.insert(key).second; }

    std::size_t size() const { return mSeen.size(); }

    void clear() { mSeen.clear(); }

private:
    std::unordered_set<std::string> mSeen;
};

} // namespace shop_harvest
