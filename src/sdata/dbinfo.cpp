// ═══════════════════════════════════════════════════════════════════
//  sdata/dbinfo.cpp — Catalog rows to schema graph
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/sdata/dbinfo.h"
#include "graphjin/console.h"

namespace graphjin::sdata {

DBInfo::DBInfo(std::vector<DBColumn> columns) : columns_(std::move(columns)) {}

void DBInfo::addColumns(const std::vector<DBColumn>& columns) {
    columns_.insert(columns_.end(), columns.begin(), columns.end());
}

std::vector<const DBColumn*> DBInfo::columnsOf(const DBTable& table) const {
    std::vector<const DBColumn*> out;
    for (auto& c : columns_) {
        if (c.tableInfo() == table) out.push_back(&c);
    }
    return out;
}

const DBColumn* DBInfo::findColumn(const DBTable& table, const std::string& column) const {
    for (auto& c : columns_) {
        if (c.name == column && c.tableInfo() == table) return &c;
    }
    return nullptr;
}

std::vector<DBTable> DBInfo::tables() const {
    std::vector<DBTable> out;
    for (auto& c : columns_) {
        auto t = c.tableInfo();
        bool seen = false;
        for (auto& o : out) {
            if (o == t) { seen = true; break; }
        }
        if (!seen) out.push_back(std::move(t));
    }
    return out;
}

const DBTable* resolveForeignTable(const DBSchema& schema, const DBColumn& col) {
    if (auto* t = schema.findTable(col.database, col.fkeySchema, col.fkeyTable)) {
        return t;
    }

    auto candidates = schema.findTablesByName(col.fkeyTable);
    const DBTable* sameSchema = nullptr;
    int sameSchemaCount = 0;
    for (auto* t : candidates) {
        if (!col.fkeySchema.empty() && t->schema == col.fkeySchema) {
            sameSchema = t;
            sameSchemaCount++;
        }
    }
    if (sameSchemaCount == 1) return sameSchema;
    if (candidates.size() == 1) return candidates.front();
    return nullptr;
}

RelType relTypeFor(const DBTable& from, const DBTable& to, bool singleMatch) {
    DBRel probe;
    probe.left.table = from;
    probe.right.table = to;
    if (probe.isCrossDatabase()) return RelType::DatabaseJoin;
    if (from == to) return RelType::Recursive;
    return singleMatch ? RelType::OneToOne : RelType::OneToMany;
}

bool addForeignKey(DBSchema& schema, const DBColumn& col) {
    const DBTable* parent = resolveForeignTable(schema, col);
    if (!parent) {
        console::warn("foreign key", col.table + "." + col.name,
                      "references unknown table", col.fkeyTable);
        return false;
    }

    DBTable child = col.tableInfo();
    DBTable target = *parent;
    bool unique = col.primaryKey || col.uniqueKey;

    DBRel forward;
    forward.type = relTypeFor(child, target, true);
    forward.left = {child, {col.name}};
    forward.right = {target, {col.fkeyColumn}};

    DBRel inverse;
    inverse.type = relTypeFor(target, child, unique);
    inverse.left = {target, {col.fkeyColumn}};
    inverse.right = {child, {col.name}};

    schema.addRelation(forward);
    if (child != target) {
        schema.addRelation(inverse);
    }
    return true;
}

std::shared_ptr<DBSchema> buildSchema(const DBInfo& info) {
    auto schema = std::make_shared<DBSchema>();
    for (auto& t : info.tables()) {
        schema->addTable(t);
    }
    for (auto& c : info.columns()) {
        if (c.hasForeignKey()) {
            addForeignKey(*schema, c);
        }
    }
    console::debug("schema built:", schema->tableCount(), "tables,",
                   schema->relationCount(), "relations");
    return schema;
}

} // namespace graphjin::sdata
