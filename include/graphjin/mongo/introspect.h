#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/introspect.h — Column catalog inferred from samples
// ═══════════════════════════════════════════════════════════════════

#include "../context.h"
#include "../sdata/schema.h"
#include "query.h"
#include "rows.h"
#include "store.h"
#include <array>
#include <string>
#include <vector>

namespace graphjin::mongo {

// Output columns, in order
inline const std::array<std::string, 11> kIntrospectColumns = {
    "table_schema", "table_name", "column_name", "data_type",
    "is_nullable", "is_primary_key", "is_unique_key", "is_array",
    "fkey_schema", "fkey_table", "fkey_column"
};

// BSON type class of a relaxed Extended JSON value
// ("integer", "double", "string", "boolean", "timestamp", "object",
//  "array", "binary", "objectid"), empty for null
std::string typeClass(const Document& value);

// ── Merges sampled documents of one collection into columns ──
class ColumnSampler {
public:
    ColumnSampler(std::string database, std::string collection)
        : database_(std::move(database)), collection_(std::move(collection)) {}

    void observe(const Document& doc);

    std::size_t sampled() const { return samples_; }

    // _id first, then first-observation order
    std::vector<sdata::DBColumn> columns() const;

private:
    struct Field {
        std::string name;
        std::vector<std::pair<std::string, std::size_t>> typeCounts;
        std::size_t seen = 0;
        std::size_t nulls = 0;
        bool array = false;
    };

    Field& field(const std::string& name);

    std::string database_;
    std::string collection_;
    std::vector<Field> fields_;
    std::size_t samples_ = 0;
};

std::vector<sdata::DBColumn> introspectCollections(DocumentStore& store,
                                                   const IntrospectOptions& options,
                                                   const Context& ctx);

std::vector<Value> toRow(const sdata::DBColumn& col);

std::unique_ptr<ColumnRows> introspectRows(DocumentStore& store,
                                           const IntrospectOptions& options,
                                           const Context& ctx);

} // namespace graphjin::mongo
