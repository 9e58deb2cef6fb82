#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/query.h — JSON query DSL understood by the driver
// ═══════════════════════════════════════════════════════════════════
//
//  {"operation":"aggregate","collection":"users",
//   "pipeline":[{"$match":{"age":{"$gt":"$1"}}}],
//   "params":["$1"]}
//
//  auto q = mongo::parseQuery(text);
//  mongo::substituteParams(q, {25});
//
// ═══════════════════════════════════════════════════════════════════

#include "../json_utils.h"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace graphjin::mongo {

enum class Operation {
    Aggregate,
    Find,
    IntrospectColumns,
    MultiAggregate
};

const char* toString(Operation op);
std::optional<Operation> parseOperation(const std::string& name);

// ── Ordering column of a paged query ──
struct CursorColumn {
    enum class Direction { Asc, Desc };
    enum class Type { Auto, Integer, Float, String };

    std::string column;
    Direction direction = Direction::Asc;
    Type type = Type::Auto;
};

// ── Paging context the upper layer attaches to a query ──
struct CursorInfo {
    int64_t selectId = 0;
    std::string prefix;
    std::vector<CursorColumn> orderBy;
    // 1-based index of the caller argument holding the raw cursor
    int cursorParam = 0;
};

// ── Options recognized for find / aggregate ──
struct FindOptions {
    std::optional<int64_t> limit;
    std::optional<int64_t> skip;
    std::optional<Document> sort;
    std::optional<Document> projection;
};

// ── Options recognized for introspect_columns ──
struct IntrospectOptions {
    static constexpr int64_t kDefaultSampleSize = 100;

    int64_t sampleSize = kDefaultSampleSize;
    std::set<std::string> collections;
};

// ═══════════════════════════════════════════
//  struct Query — one parsed DSL request
// ═══════════════════════════════════════════
struct Query {
    Operation operation = Operation::Aggregate;
    std::string collection;
    std::string fieldName;
    bool singular = false;
    Document pipeline = Document::array();
    Document filter = Document::object();
    Document options = Document::object();
    std::vector<std::string> params;
    std::optional<CursorInfo> cursorInfo;
    // Sub-queries of a multi_aggregate
    std::vector<Query> queries;
    // Unrecognized top-level fields, kept for forward compatibility
    Document extras = Document::object();

    FindOptions findOptions() const;
    IntrospectOptions introspectOptions() const;

    bool operator==(const Query& other) const;
};

// Throws graphjin::Error (MalformedInput, MissingOperation, UnsupportedOperation)
Query parseQuery(const std::string& text);
Query parseQuery(const Document& doc);
// Disambiguates string literals, which convert equally well to both overloads
inline Query parseQuery(const char* text) { return parseQuery(std::string(text)); }

Document toDocument(const Query& query);
std::string serialize(const Query& query);

// ── Placeholder helpers ──

// 1-based index of a "$N" placeholder, nullopt for any other string
std::optional<std::size_t> placeholderIndex(const std::string& value);

// Replaces "$N" values (never keys) in pipeline, filter and options.
// Throws MissingParameter when N exceeds args.size().
void substituteParams(Query& query, const std::vector<Document>& args);

// Same walk over a single document
void substituteDocument(Document& doc, const std::vector<Document>& args);

} // namespace graphjin::mongo
