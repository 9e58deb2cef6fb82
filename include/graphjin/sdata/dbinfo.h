#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/sdata/dbinfo.h — Build a schema graph from catalog rows
// ═══════════════════════════════════════════════════════════════════
//
//  Catalog rows come from any backend: SQLite discovery, document
//  store introspection, or hand-written test fixtures. Every row with
//  a foreign key becomes a pair of relations:
//
//    child.fk  ──OneToOne──▶  parent.pk      (forward)
//    parent.pk ──OneToMany─▶  child.fk       (inverse)
//
//  Same-table keys become Recursive edges, keys that cross databases
//  become DatabaseJoin edges.
// ═══════════════════════════════════════════════════════════════════

#include "schema.h"
#include <memory>
#include <string>
#include <vector>

namespace graphjin::sdata {

// ── Column lookup over a set of catalog rows ──
class DBInfo {
public:
    DBInfo() = default;
    explicit DBInfo(std::vector<DBColumn> columns);

    void addColumns(const std::vector<DBColumn>& columns);

    const std::vector<DBColumn>& columns() const { return columns_; }

    // Columns of one table, catalog order
    std::vector<const DBColumn*> columnsOf(const DBTable& table) const;

    const DBColumn* findColumn(const DBTable& table, const std::string& column) const;

    // Distinct tables in first-seen order
    std::vector<DBTable> tables() const;

private:
    std::vector<DBColumn> columns_;
};

// Resolves a foreign key target. The parent is looked up in the
// child's database first, then anywhere by (schema, name), then by
// name alone when that is unambiguous.
const DBTable* resolveForeignTable(const DBSchema& schema, const DBColumn& col);

// Relation type for an FK edge. singleMatch: each `from` row matches
// at most one `to` row.
RelType relTypeFor(const DBTable& from, const DBTable& to, bool singleMatch);

// Adds the forward and inverse relations for one FK column.
// Returns false if the parent table is unknown.
bool addForeignKey(DBSchema& schema, const DBColumn& col);

std::shared_ptr<DBSchema> buildSchema(const DBInfo& info);

} // namespace graphjin::sdata
