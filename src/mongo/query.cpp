// ═══════════════════════════════════════════════════════════════════
//  mongo/query.cpp — Query DSL parsing, serialization, substitution
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/query.h"
#include "graphjin/error.h"
#include <limits>

namespace graphjin::mongo {

namespace {

[[noreturn]] void malformed(const std::string& message) {
    throw Error(ErrorKind::MalformedInput, message);
}

bool isPlaceholder(const Document& v) {
    return v.is_string() && placeholderIndex(v.get_ref<const std::string&>()).has_value();
}

// Option values may still be placeholders before substitution
void checkOption(const Document& options, const char* key, bool (*ok)(const Document&),
                 const char* expected) {
    auto it = options.find(key);
    if (it == options.end() || isPlaceholder(*it)) return;
    if (!ok(*it)) {
        malformed(std::string("option '") + key + "' must be " + expected);
    }
}

// Unsigned values above INT64_MAX do not fit
bool fitsInt64(const Document& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return v.is_number_integer();
}

bool isNonNegativeInt(const Document& v) {
    return fitsInt64(v) && v.get<int64_t>() >= 0;
}

bool isPositiveInt(const Document& v) {
    return fitsInt64(v) && v.get<int64_t>() > 0;
}

bool isObject(const Document& v) { return v.is_object(); }

bool isStringArray(const Document& v) {
    if (!v.is_array()) return false;
    for (auto& item : v) {
        if (!item.is_string()) return false;
    }
    return true;
}

void validateOptions(Operation op, const Document& options) {
    switch (op) {
        case Operation::IntrospectColumns:
            checkOption(options, "sample_size", isPositiveInt, "a positive integer");
            checkOption(options, "collections", isStringArray, "an array of names");
            break;
        case Operation::Find:
        case Operation::Aggregate:
            checkOption(options, "limit", isNonNegativeInt, "a non-negative integer");
            checkOption(options, "skip", isNonNegativeInt, "a non-negative integer");
            checkOption(options, "sort", isObject, "an object");
            checkOption(options, "projection", isObject, "an object");
            break;
        case Operation::MultiAggregate:
            break;
    }
}

CursorColumn::Direction parseDirection(const std::string& s) {
    if (s == "asc" || s == "ASC") return CursorColumn::Direction::Asc;
    if (s == "desc" || s == "DESC") return CursorColumn::Direction::Desc;
    malformed("cursor_info: unknown direction '" + s + "'");
}

CursorColumn::Type parseColumnType(const std::string& s) {
    if (s.empty() || s == "auto") return CursorColumn::Type::Auto;
    if (s == "integer" || s == "int") return CursorColumn::Type::Integer;
    if (s == "float" || s == "double" || s == "numeric") return CursorColumn::Type::Float;
    if (s == "string" || s == "text") return CursorColumn::Type::String;
    malformed("cursor_info: unknown column type '" + s + "'");
}

const char* directionName(CursorColumn::Direction d) {
    return d == CursorColumn::Direction::Desc ? "desc" : "asc";
}

const char* columnTypeName(CursorColumn::Type t) {
    switch (t) {
        case CursorColumn::Type::Integer: return "integer";
        case CursorColumn::Type::Float:   return "float";
        case CursorColumn::Type::String:  return "string";
        case CursorColumn::Type::Auto:    break;
    }
    return "auto";
}

CursorInfo parseCursorInfo(const Document& v) {
    if (!v.is_object()) malformed("cursor_info must be an object");

    CursorInfo info;
    if (auto it = v.find("select_id"); it != v.end()) {
        if (!isNonNegativeInt(*it)) malformed("cursor_info.select_id must be a non-negative integer");
        info.selectId = it->get<int64_t>();
    }
    if (auto it = v.find("prefix"); it != v.end()) {
        if (!it->is_string()) malformed("cursor_info.prefix must be a string");
        info.prefix = it->get<std::string>();
    }
    if (auto it = v.find("cursor_param"); it != v.end()) {
        if (!isPositiveInt(*it) || it->get<int64_t>() > std::numeric_limits<int>::max()) {
            malformed("cursor_info.cursor_param must be a positive integer");
        }
        info.cursorParam = it->get<int>();
    }
    if (auto it = v.find("order_by"); it != v.end()) {
        if (!it->is_array()) malformed("cursor_info.order_by must be an array");
        for (auto& item : *it) {
            if (!item.is_object() || !item.contains("column") || !item["column"].is_string()) {
                malformed("cursor_info.order_by entries need a column name");
            }
            CursorColumn col;
            col.column = item["column"].get<std::string>();
            if (auto d = item.find("direction"); d != item.end()) {
                if (!d->is_string()) malformed("cursor_info.order_by direction must be a string");
                col.direction = parseDirection(d->get<std::string>());
            }
            if (auto t = item.find("type"); t != item.end()) {
                if (!t->is_string()) malformed("cursor_info.order_by type must be a string");
                col.type = parseColumnType(t->get<std::string>());
            }
            info.orderBy.push_back(std::move(col));
        }
    }
    return info;
}

Document cursorInfoDocument(const CursorInfo& info) {
    Document orderBy = Document::array();
    for (auto& c : info.orderBy) {
        Document col = {{"column", c.column}, {"direction", directionName(c.direction)}};
        if (c.type != CursorColumn::Type::Auto) col["type"] = columnTypeName(c.type);
        orderBy.push_back(std::move(col));
    }
    Document out = {
        {"select_id", info.selectId},
        {"prefix", info.prefix},
        {"order_by", std::move(orderBy)}
    };
    if (info.cursorParam > 0) out["cursor_param"] = info.cursorParam;
    return out;
}

} // namespace

const char* toString(Operation op) {
    switch (op) {
        case Operation::Aggregate:         return "aggregate";
        case Operation::Find:              return "find";
        case Operation::IntrospectColumns: return "introspect_columns";
        case Operation::MultiAggregate:    return "multi_aggregate";
    }
    return "unknown";
}

std::optional<Operation> parseOperation(const std::string& name) {
    if (name == "aggregate") return Operation::Aggregate;
    if (name == "find") return Operation::Find;
    if (name == "introspect_columns") return Operation::IntrospectColumns;
    if (name == "multi_aggregate") return Operation::MultiAggregate;
    return std::nullopt;
}

Query parseQuery(const std::string& text) {
    Document doc;
    try {
        doc = Document::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Error(ErrorKind::MalformedInput, e.what());
    }
    return parseQuery(doc);
}

Query parseQuery(const Document& doc) {
    if (!doc.is_object()) malformed("query must be a JSON object");

    auto opIt = doc.find("operation");
    if (opIt == doc.end() || !opIt->is_string()) {
        throw Error(ErrorKind::MissingOperation, "query has no operation");
    }
    auto op = parseOperation(opIt->get<std::string>());
    if (!op) {
        throw Error(ErrorKind::UnsupportedOperation,
                    "unknown operation '" + opIt->get<std::string>() + "'");
    }

    Query q;
    q.operation = *op;

    for (auto& [key, value] : doc.items()) {
        if (key == "operation") {
            continue;
        } else if (key == "collection") {
            if (!value.is_string()) malformed("collection must be a string");
            q.collection = value.get<std::string>();
        } else if (key == "field_name") {
            if (!value.is_string()) malformed("field_name must be a string");
            q.fieldName = value.get<std::string>();
        } else if (key == "singular") {
            if (!value.is_boolean()) malformed("singular must be a boolean");
            q.singular = value.get<bool>();
        } else if (key == "pipeline") {
            if (!value.is_array()) malformed("pipeline must be an array");
            for (auto& stage : value) {
                if (!stage.is_object()) malformed("pipeline stages must be objects");
            }
            q.pipeline = value;
        } else if (key == "filter") {
            if (!value.is_object()) malformed("filter must be an object");
            q.filter = value;
        } else if (key == "options") {
            if (!value.is_object()) malformed("options must be an object");
            q.options = value;
        } else if (key == "params") {
            if (!isStringArray(value)) malformed("params must be an array of strings");
            q.params = value.get<std::vector<std::string>>();
        } else if (key == "cursor_info") {
            if (!value.is_null()) q.cursorInfo = parseCursorInfo(value);
        } else if (key == "queries") {
            if (!value.is_array()) malformed("queries must be an array");
            for (auto& sub : value) {
                q.queries.push_back(parseQuery(sub));
            }
        } else {
            q.extras[key] = value;
        }
    }

    if ((q.operation == Operation::Aggregate || q.operation == Operation::Find) &&
        q.collection.empty()) {
        malformed(std::string(toString(q.operation)) + " requires a collection");
    }
    if (q.operation == Operation::MultiAggregate) {
        for (auto& sub : q.queries) {
            if (sub.operation != Operation::Aggregate) {
                malformed("multi_aggregate accepts only aggregate sub-queries");
            }
        }
    }
    validateOptions(q.operation, q.options);
    return q;
}

Document toDocument(const Query& q) {
    Document out = Document::object();
    out["operation"] = toString(q.operation);
    if (!q.collection.empty()) out["collection"] = q.collection;
    if (!q.fieldName.empty()) out["field_name"] = q.fieldName;
    if (q.singular) out["singular"] = true;
    if (q.operation == Operation::Aggregate || !q.pipeline.empty()) {
        out["pipeline"] = q.pipeline;
    }
    if (q.operation == Operation::Find || !q.filter.empty()) {
        out["filter"] = q.filter;
    }
    if (!q.options.empty()) out["options"] = q.options;
    if (!q.params.empty()) out["params"] = q.params;
    if (q.cursorInfo) out["cursor_info"] = cursorInfoDocument(*q.cursorInfo);
    if (!q.queries.empty()) {
        Document subs = Document::array();
        for (auto& sub : q.queries) subs.push_back(toDocument(sub));
        out["queries"] = std::move(subs);
    }
    for (auto& [key, value] : q.extras.items()) {
        out[key] = value;
    }
    return out;
}

std::string serialize(const Query& query) {
    return toDocument(query).dump();
}

bool Query::operator==(const Query& other) const {
    return toDocument(*this) == toDocument(other);
}

FindOptions Query::findOptions() const {
    FindOptions opts;
    auto intOption = [&](const char* key) -> std::optional<int64_t> {
        auto it = options.find(key);
        if (it == options.end() || it->is_null()) return std::nullopt;
        if (!isNonNegativeInt(*it)) {
            malformed(std::string("option '") + key + "' must be a non-negative integer");
        }
        return it->get<int64_t>();
    };
    auto docOption = [&](const char* key) -> std::optional<Document> {
        auto it = options.find(key);
        if (it == options.end() || it->is_null()) return std::nullopt;
        if (!it->is_object()) malformed(std::string("option '") + key + "' must be an object");
        return *it;
    };
    opts.limit = intOption("limit");
    opts.skip = intOption("skip");
    opts.sort = docOption("sort");
    opts.projection = docOption("projection");
    return opts;
}

IntrospectOptions Query::introspectOptions() const {
    IntrospectOptions opts;
    if (auto it = options.find("sample_size"); it != options.end() && !it->is_null()) {
        if (!isPositiveInt(*it)) malformed("option 'sample_size' must be a positive integer");
        opts.sampleSize = it->get<int64_t>();
    }
    if (auto it = options.find("collections"); it != options.end() && !it->is_null()) {
        if (!isStringArray(*it)) malformed("option 'collections' must be an array of names");
        for (auto& name : *it) opts.collections.insert(name.get<std::string>());
    }
    return opts;
}

std::optional<std::size_t> placeholderIndex(const std::string& value) {
    // "$" + up to 9 digits, no leading zero
    if (value.size() < 2 || value.size() > 10 || value[0] != '$' || value[1] == '0') {
        return std::nullopt;
    }
    std::size_t n = 0;
    for (std::size_t i = 1; i < value.size(); i++) {
        char c = value[i];
        if (c < '0' || c > '9') return std::nullopt;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    return n;
}

void substituteDocument(Document& doc, const std::vector<Document>& args) {
    if (doc.is_string()) {
        auto idx = placeholderIndex(doc.get_ref<const std::string&>());
        if (!idx) return;
        if (*idx > args.size()) {
            throw Error(ErrorKind::MissingParameter,
                        "placeholder $" + std::to_string(*idx) + " but only " +
                        std::to_string(args.size()) + " argument(s) given");
        }
        doc = args[*idx - 1];
        return;
    }
    if (doc.is_object() || doc.is_array()) {
        for (auto& child : doc) {
            substituteDocument(child, args);
        }
    }
}

void substituteParams(Query& query, const std::vector<Document>& args) {
    substituteDocument(query.pipeline, args);
    substituteDocument(query.filter, args);
    substituteDocument(query.options, args);
    for (auto& sub : query.queries) {
        substituteParams(sub, args);
    }
}

} // namespace graphjin::mongo
