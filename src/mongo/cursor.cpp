// ═══════════════════════════════════════════════════════════════════
//  mongo/cursor.cpp — Cursor normalization, seek filters, cursor cache
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/cursor.h"
#include "graphjin/console.h"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <openssl/sha.h>

namespace graphjin::mongo {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isHex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && isSpace(s[b])) b++;
    while (e > b && isSpace(s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::optional<int64_t> parseInt64(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<double> parseDouble(const std::string& s) {
    double v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

// Leads a string value that would otherwise read back as a number
constexpr char kStringTag = '\'';

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

// Percent-escapes the characters a cursor field reserves
std::string escapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '%':  out += "%25"; break;
            case ':':  out += "%3A"; break;
            case '\'': out += "%27"; break;
            default:   out += c;
        }
    }
    return out;
}

// Malformed escapes pass through unchanged
std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%' && i + 2 < s.size() && isHex(s[i + 1]) && isHex(s[i + 2])) {
            out += static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::optional<Document> parseValue(const std::string& raw, const CursorColumn& col,
                                   bool identity) {
    bool tagged = !raw.empty() && raw.front() == kStringTag;
    std::string field = unescapeField(tagged ? raw.substr(1) : raw);

    switch (col.type) {
        case CursorColumn::Type::Integer:
            if (auto i = parseInt64(field)) return Document(*i);
            return std::nullopt;
        case CursorColumn::Type::Float:
            if (auto d = parseDouble(field)) return Document(*d);
            return std::nullopt;
        case CursorColumn::Type::String:
            return Document(field);
        case CursorColumn::Type::Auto:
            break;
    }
    if (tagged) {
        if (identity) return std::nullopt;
        return Document(field);
    }
    if (identity) {
        if (auto i = parseInt64(field)) return Document(*i);
        return std::nullopt;
    }
    if (auto i = parseInt64(field)) return Document(*i);
    if (auto d = parseDouble(field)) return Document(*d);
    return Document(field);
}

Document fieldEquals(const std::string& field, const Document& value) {
    Document d = Document::object();
    d[field] = value;
    return d;
}

Document fieldCompare(const std::string& field, const char* op, const Document& value) {
    Document cmp = Document::object();
    cmp[op] = value;
    Document d = Document::object();
    d[field] = std::move(cmp);
    return d;
}

std::string renderValue(const Document& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_float()) return v.dump();
    if (v.is_object() && v.size() == 1) {
        // Extended JSON scalars: {"$oid": ...}, {"$numberLong": ...}
        auto it = v.begin();
        if (it.key().rfind('$', 0) == 0 && it.value().is_string()) {
            return it.value().get<std::string>();
        }
    }
    if (v.is_null()) return "";
    return v.dump();
}

} // namespace

std::string storeField(const std::string& column) {
    return column == "id" ? "_id" : column;
}

std::string normalizeCursor(const CursorInfo& info, const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return s;

    if (!info.prefix.empty()) {
        if (s.compare(0, info.prefix.size(), info.prefix) == 0) {
            return s.substr(info.prefix.size());
        }
        return s;
    }

    const std::string tag = kCursorTag;
    if (s.compare(0, tag.size(), tag) == 0) {
        std::size_t i = tag.size();
        while (i < s.size() && isHex(s[i])) i++;
        if (i < s.size() && s[i] == ':') {
            return s.substr(i + 1);
        }
    }
    return s;
}

std::optional<Document> buildSeekFilter(const CursorInfo& info, const std::string& raw) {
    std::string cursor = normalizeCursor(info, raw);
    if (cursor.empty()) return std::nullopt;

    auto fields = split(cursor, ':');
    auto selId = parseInt64(fields.front());
    if (!selId || *selId != info.selectId) {
        console::debug("cursor-invalid: select id mismatch, want", info.selectId,
                       "cursor", cursor);
        return std::nullopt;
    }
    if (info.orderBy.empty() || fields.size() - 1 != info.orderBy.size()) {
        console::debug("cursor-invalid: expected", info.orderBy.size(), "values, got",
                       fields.size() - 1);
        return std::nullopt;
    }

    const std::size_t n = info.orderBy.size();
    std::vector<std::string> names;
    std::vector<Document> values;
    for (std::size_t i = 0; i < n; i++) {
        const auto& col = info.orderBy[i];
        std::string name = storeField(col.column);
        bool identity = (i == n - 1) && name == "_id";
        auto v = parseValue(fields[i + 1], col, identity);
        if (!v) {
            console::warn("type-mismatch: cursor value", "'" + fields[i + 1] + "'",
                          "does not fit column", col.column);
            return std::nullopt;
        }
        names.push_back(std::move(name));
        values.push_back(std::move(*v));
    }

    Document clauses = Document::array();
    for (std::size_t k = 0; k < n; k++) {
        const char* op = info.orderBy[k].direction == CursorColumn::Direction::Desc ? "$lt" : "$gt";
        Document cmp = fieldCompare(names[k], op, values[k]);
        if (k == 0) {
            clauses.push_back(std::move(cmp));
            continue;
        }
        Document conj = Document::array();
        for (std::size_t j = 0; j < k; j++) {
            conj.push_back(fieldEquals(names[j], values[j]));
        }
        conj.push_back(std::move(cmp));
        Document clause = Document::object();
        clause["$and"] = std::move(conj);
        clauses.push_back(std::move(clause));
    }

    Document body;
    if (n == 1) {
        body = std::move(clauses[0]);
    } else {
        body = Document::object();
        body["$or"] = std::move(clauses);
    }
    Document match = Document::object();
    match["$match"] = std::move(body);
    return match;
}

std::string encodeCursor(const CursorInfo& info, const Document& doc) {
    std::string out = info.prefix + std::to_string(info.selectId);
    for (auto& col : info.orderBy) {
        out += ':';
        auto it = doc.find(storeField(col.column));
        if (it == doc.end()) it = doc.find(col.column);
        if (it == doc.end()) continue;

        std::string text = renderValue(*it);
        if (it->is_string() && col.type == CursorColumn::Type::Auto &&
            (parseInt64(text) || parseDouble(text))) {
            out += kStringTag;
        }
        out += escapeField(text);
    }
    return out;
}

std::string cursorPrefix(const std::string& seed) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(seed.data()), seed.size(), hash);
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%02x%02x%02x%02x", hash[0], hash[1], hash[2], hash[3]);
    return std::string(kCursorTag) + hex + ":";
}

bool applyCursor(Query& query, const std::string& raw) {
    if (!query.cursorInfo) return false;
    if (query.operation != Operation::Aggregate && query.operation != Operation::Find) {
        return false;
    }
    auto seek = buildSeekFilter(*query.cursorInfo, raw);
    if (!seek) return false;

    if (query.operation == Operation::Aggregate) {
        query.pipeline.insert(query.pipeline.begin(), std::move(*seek));
        return true;
    }

    Document& cond = (*seek)["$match"];
    if (query.filter.empty()) {
        query.filter = std::move(cond);
    } else {
        Document both = Document::array();
        both.push_back(std::move(query.filter));
        both.push_back(std::move(cond));
        query.filter = Document::object();
        query.filter["$and"] = std::move(both);
    }
    return true;
}

// ═══════════════════════════════════════════
//  CursorCache
// ═══════════════════════════════════════════

CursorCache::CursorCache(std::size_t maxEntries, std::chrono::milliseconds ttl)
    : maxEntries_(maxEntries > 0 ? maxEntries : kDefaultMaxEntries), ttl_(ttl) {}

uint64_t CursorCache::set(const std::string& cursor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    auto found = byCursor_.find(cursor);
    if (found != byCursor_.end()) {
        auto it = byId_.at(found->second);
        it->createdAt = now;
        list_.splice(list_.begin(), list_, it);
        return it->id;
    }

    uint64_t id = ++nextId_;
    list_.push_front({id, cursor, now});
    byId_[id] = list_.begin();
    byCursor_[cursor] = id;
    evict();
    return id;
}

std::optional<std::string> CursorCache::get(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = byId_.find(id);
    if (found == byId_.end()) return std::nullopt;

    auto it = found->second;
    if (expired(*it, Clock::now())) {
        erase(it);
        return std::nullopt;
    }
    list_.splice(list_.begin(), list_, it);
    return it->cursor;
}

std::size_t CursorCache::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    std::size_t removed = 0;
    for (auto it = list_.begin(); it != list_.end();) {
        auto next = std::next(it);
        if (expired(*it, now)) {
            erase(it);
            removed++;
        }
        it = next;
    }
    return removed;
}

std::size_t CursorCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return byId_.size();
}

void CursorCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    list_.clear();
    byId_.clear();
    byCursor_.clear();
}

void CursorCache::erase(std::list<Entry>::iterator it) {
    byCursor_.erase(it->cursor);
    byId_.erase(it->id);
    list_.erase(it);
}

void CursorCache::evict() {
    while (byId_.size() > maxEntries_) {
        erase(std::prev(list_.end()));
    }
}

} // namespace graphjin::mongo
