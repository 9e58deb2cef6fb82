#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/cursor.h — Opaque cursors and keyset seek filters
// ═══════════════════════════════════════════════════════════════════
//
//  Wire form:  <prefix><select_id>:<v1>:<v2>:...:<vN>
//
//  The values are the last row's order-by columns. A cursor becomes a
//  $match stage selecting rows strictly after that row:
//
//    (c1 op v1) OR (c1 = v1 AND c2 op v2) OR ...
//
//  Unusable cursors (wrong select id, wrong arity, unparsable values)
//  yield no filter so the caller falls back to a fresh scan.
// ═══════════════════════════════════════════════════════════════════

#include "query.h"
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphjin::mongo {

// Literal tag of generated cursor prefixes: "gj-<hex>:"
inline constexpr const char* kCursorTag = "gj-";

// Column name as stored in the collection ("id" is the document _id)
std::string storeField(const std::string& column);

std::string normalizeCursor(const CursorInfo& info, const std::string& raw);

// {"$match": {...}} or nullopt when the cursor cannot be applied
std::optional<Document> buildSeekFilter(const CursorInfo& info, const std::string& raw);

// Cursor for the row `doc` under this paging context. Values are
// percent-escaped; a string that reads as a number under an untyped
// column is tagged with a leading '\'' so it reads back as a string.
std::string encodeCursor(const CursorInfo& info, const Document& doc);

// "gj-" + 8 hex chars of SHA-256(seed) + ":"
std::string cursorPrefix(const std::string& seed);

// Adds the seek filter for `raw` to the query. Returns false (query
// untouched) when no filter applies.
bool applyCursor(Query& query, const std::string& raw);

// ═══════════════════════════════════════════
//  class CursorCache
//  Hands out short numeric ids for long cursor strings. The same
//  cursor always maps to the same live id; entries expire after `ttl`
//  and the least recently used entry goes first when full.
// ═══════════════════════════════════════════
class CursorCache {
public:
    static constexpr std::size_t kDefaultMaxEntries = 10000;

    explicit CursorCache(std::size_t maxEntries = kDefaultMaxEntries,
                         std::chrono::milliseconds ttl = std::chrono::hours(1));

    uint64_t set(const std::string& cursor);
    std::optional<std::string> get(uint64_t id);

    // Drops expired entries; returns how many were removed
    std::size_t purgeExpired();

    std::size_t size();
    void clear();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        uint64_t id;
        std::string cursor;
        Clock::time_point createdAt;
    };

    bool expired(const Entry& e, Clock::time_point now) const {
        return now - e.createdAt > ttl_;
    }
    void erase(std::list<Entry>::iterator it);
    void evict();

    std::size_t maxEntries_;
    std::chrono::milliseconds ttl_;
    uint64_t nextId_ = 0;
    // Front is most recently used
    std::list<Entry> list_;
    std::unordered_map<uint64_t, std::list<Entry>::iterator> byId_;
    std::unordered_map<std::string, uint64_t> byCursor_;
    std::mutex mutex_;
};

} // namespace graphjin::mongo
