// ═══════════════════════════════════════════════════════════════════
//  mongo/introspect.cpp — Sampling-based column inference
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/introspect.h"
#include "graphjin/console.h"
#include <algorithm>

namespace graphjin::mongo {

std::string typeClass(const Document& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:            return "";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "double";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::binary:          return "binary";
        default:                                       break;
    }

    // Extended JSON wrappers
    if (v.contains("$oid")) return "objectid";
    if (v.contains("$date") || v.contains("$timestamp")) return "timestamp";
    if (v.contains("$binary") || v.contains("$uuid")) return "binary";
    if (v.contains("$numberInt") || v.contains("$numberLong")) return "integer";
    if (v.contains("$numberDouble") || v.contains("$numberDecimal")) return "double";
    if (v.contains("$regularExpression") || v.contains("$symbol")) return "string";
    return "object";
}

ColumnSampler::Field& ColumnSampler::field(const std::string& name) {
    for (auto& f : fields_) {
        if (f.name == name) return f;
    }
    fields_.push_back(Field{name, {}, 0, 0, false});
    return fields_.back();
}

void ColumnSampler::observe(const Document& doc) {
    if (!doc.is_object()) return;
    samples_++;

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto& f = field(it.key());
        f.seen++;

        const auto& value = it.value();
        if (value.is_array()) f.array = true;

        std::string cls = typeClass(value);
        if (cls.empty()) {
            f.nulls++;
            continue;
        }
        auto tc = std::find_if(f.typeCounts.begin(), f.typeCounts.end(),
                               [&](const auto& p) { return p.first == cls; });
        if (tc == f.typeCounts.end()) {
            f.typeCounts.emplace_back(cls, 1);
        } else {
            tc->second++;
        }
    }
}

std::vector<sdata::DBColumn> ColumnSampler::columns() const {
    std::vector<const Field*> ordered;
    for (auto& f : fields_) {
        if (f.name == "_id") ordered.insert(ordered.begin(), &f);
        else ordered.push_back(&f);
    }

    std::vector<sdata::DBColumn> out;
    out.reserve(ordered.size());
    for (auto* f : ordered) {
        sdata::DBColumn c;
        c.name = f->name;
        c.table = collection_;
        c.schema = database_;
        c.database = database_;

        // Most frequent class; first observed wins a tie
        const std::pair<std::string, std::size_t>* best = nullptr;
        for (auto& tc : f->typeCounts) {
            if (!best || tc.second > best->second) best = &tc;
        }
        c.type = best ? best->first : "string";

        bool isId = f->name == "_id";
        bool mixed = f->typeCounts.size() > 1;
        bool sometimesMissing = f->seen < samples_ || f->nulls > 0;
        c.notNull = isId || !(mixed || sometimesMissing);
        c.primaryKey = isId;
        c.uniqueKey = isId;
        c.array = f->array;
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<sdata::DBColumn> introspectCollections(DocumentStore& store,
                                                   const IntrospectOptions& options,
                                                   const Context& ctx) {
    auto names = store.listCollections(ctx);
    std::sort(names.begin(), names.end());

    std::vector<std::string> targets;
    for (auto& name : names) {
        if (name.rfind("system.", 0) == 0) continue;
        if (!options.collections.empty() && !options.collections.count(name)) continue;
        targets.push_back(name);
    }
    for (auto& wanted : options.collections) {
        if (!std::binary_search(names.begin(), names.end(), wanted)) {
            console::debug("introspect: collection", wanted, "not found in", store.name());
        }
    }

    std::vector<sdata::DBColumn> out;
    for (auto& name : targets) {
        ctx.throwIfCancelled();

        ColumnSampler sampler(store.name(), name);
        DocumentRows rows(store.sample(name, options.sampleSize, ctx), {"json"}, ctx);
        Document doc;
        while (rows.nextDocument(doc)) {
            sampler.observe(doc);
        }

        auto cols = sampler.columns();
        console::debug("introspect:", name, "sampled", sampler.sampled(), "documents,",
                       cols.size(), "columns");
        out.insert(out.end(), cols.begin(), cols.end());
    }
    return out;
}

std::vector<Value> toRow(const sdata::DBColumn& col) {
    return {
        col.schema, col.table, col.name, col.type,
        !col.notNull, col.primaryKey, col.uniqueKey, col.array,
        col.fkeySchema, col.fkeyTable, col.fkeyColumn
    };
}

std::unique_ptr<ColumnRows> introspectRows(DocumentStore& store,
                                           const IntrospectOptions& options,
                                           const Context& ctx) {
    auto cols = introspectCollections(store, options, ctx);
    std::vector<std::vector<Value>> data;
    data.reserve(cols.size());
    for (auto& c : cols) {
        data.push_back(toRow(c));
    }
    return std::make_unique<ColumnRows>(
        std::vector<std::string>(kIntrospectColumns.begin(), kIntrospectColumns.end()),
        std::move(data));
}

} // namespace graphjin::mongo
