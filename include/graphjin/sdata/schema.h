#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/sdata/schema.h — Tables, relations and the schema graph
// ═══════════════════════════════════════════════════════════════════
//
//  A table lives in (database, schema, name) space. An empty database
//  name means the default database of the service. Relations are
//  directed edges; the schema never adds inverses on its own.
//
//  auto schema = std::make_shared<DBSchema>();
//  schema->addTable({"users", "public", "main"});
//  schema->addRelation(rel);
//  for (auto* r : schema->relationsOf(users)) { ... }
//
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace graphjin::sdata {

// ── Table descriptor ──
struct DBTable {
    std::string name;
    std::string schema;
    std::string database;

    bool operator==(const DBTable& other) const {
        return name == other.name && schema == other.schema &&
               database == other.database;
    }
    bool operator!=(const DBTable& other) const { return !(*this == other); }

    // "database.schema.name" with empty parts omitted
    std::string qualifiedName() const;
};

// ── One catalog row: a column of a table ──
struct DBColumn {
    std::string name;
    std::string table;
    std::string schema;
    std::string database;
    std::string type;
    bool notNull = false;
    bool primaryKey = false;
    bool uniqueKey = false;
    bool array = false;
    std::string fkeySchema;
    std::string fkeyTable;
    std::string fkeyColumn;

    bool hasForeignKey() const { return !fkeyTable.empty() && !fkeyColumn.empty(); }
    DBTable tableInfo() const { return {table, schema, database}; }
};

// ── Relation kind ──
enum class RelType {
    None = 0,
    OneToOne,
    OneToMany,
    Polymorphic,
    Recursive,
    Embedded,
    Remote,
    Skip,
    DatabaseJoin
};

const char* toString(RelType type);

// ── One side of a relation ──
struct DBRelSide {
    DBTable table;
    std::vector<std::string> columns;
};

// ── Directed relation between two tables ──
struct DBRel {
    RelType type = RelType::None;
    DBRelSide left;
    DBRelSide right;

    // True iff both sides name a database and the names differ.
    // The relation type is not consulted.
    bool isCrossDatabase() const {
        const auto& l = left.table.database;
        const auto& r = right.table.database;
        return !l.empty() && !r.empty() && l != r;
    }
};

// ═══════════════════════════════════════════
//  class DBSchema
//  Bag of tables plus a directed multigraph of relations.
//  Build it, then publish it through SchemaStore and treat it as
//  immutable.
// ═══════════════════════════════════════════
class DBSchema {
public:
    // Returns false if an identical table is already present
    bool addTable(const DBTable& table);

    // Adds one directed edge. Unknown tables on either side are added.
    void addRelation(const DBRel& rel);

    const DBTable* findTable(const std::string& database,
                             const std::string& schema,
                             const std::string& name) const;

    // Tables with this name in any database/schema
    std::vector<const DBTable*> findTablesByName(const std::string& name) const;

    // Relations with `table` on either side; a self-reference is listed once
    std::vector<const DBRel*> relationsOf(const DBTable& table) const;

    // Relations leaving `table` (table on the left side)
    std::vector<const DBRel*> relationsFrom(const DBTable& table) const;

    const std::vector<DBTable>& tables() const { return tables_; }
    const std::vector<DBRel>& relations() const { return relations_; }
    std::size_t tableCount() const { return tables_.size(); }
    std::size_t relationCount() const { return relations_.size(); }

    // Names of every non-empty database mentioned by a table
    std::vector<std::string> databases() const;

private:
    std::vector<DBTable> tables_;
    std::vector<DBRel> relations_;
};

// ═══════════════════════════════════════════
//  class SchemaStore
//  Publishes immutable schema snapshots. A reader holding a snapshot
//  keeps it alive across a reload.
// ═══════════════════════════════════════════
class SchemaStore {
public:
    SchemaStore() : current_(std::make_shared<const DBSchema>()) {}
    explicit SchemaStore(std::shared_ptr<const DBSchema> initial)
        : current_(initial ? std::move(initial) : std::make_shared<const DBSchema>()) {}

    std::shared_ptr<const DBSchema> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void publish(std::shared_ptr<const DBSchema> next) {
        if (!next) return;
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(next);
        version_++;
    }

    std::size_t version() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return version_;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const DBSchema> current_;
    std::size_t version_ = 0;
};

} // namespace graphjin::sdata
